// ============= src/analysis/emotion_recognizer.cpp =============
#include "analysis/emotion_recognizer.hpp"
#include "core/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

// ==================== EmotionResult ====================

float EmotionResult::probability(Emotion e) const {
    size_t idx = static_cast<size_t>(e);
    return idx < probabilities.size() ? probabilities[idx] : 0.0f;
}

std::string EmotionResult::to_string() const {
    return emotion_to_string(emotion) +
           " (" + std::to_string(static_cast<int>(confidence * 100)) + "%)";
}

std::string emotion_to_string(Emotion emotion) {
    switch (emotion) {
        case Emotion::NEUTRAL:    return "Neutral";
        case Emotion::HAPPINESS:  return "Happy";
        case Emotion::SURPRISE:   return "Surprised";
        case Emotion::SADNESS:    return "Sad";
        case Emotion::ANGER:      return "Angry";
        case Emotion::DISGUST:    return "Disgusted";
        case Emotion::FEAR:       return "Fearful";
        case Emotion::CONTEMPT:   return "Contemptuous";
        default:                  return "Unknown";
    }
}

// ==================== FerPlusEmotionScorer ====================

FerPlusEmotionScorer::FerPlusEmotionScorer(const std::string& model_path) {
    spdlog::info("😊 Inicializando FER+ Emotion Recognizer");

    if (!std::filesystem::exists(model_path)) {
        throw photorank::ModelUnavailableError("Emotion model not found: " + model_path);
    }

    try {
        net = cv::dnn::readNetFromONNX(model_path);
    } catch (const cv::Exception& e) {
        throw photorank::ModelUnavailableError(std::string("Cannot load emotion model: ") + e.what());
    }

    if (net.empty()) {
        throw photorank::ModelUnavailableError("Emotion model is empty: " + model_path);
    }

    spdlog::info("✓ Emotion Recognizer ready ({} emotions, {}x{})",
                 num_classes, input_width, input_height);
}

cv::Mat FerPlusEmotionScorer::preprocess(const cv::Mat& face) const {
    cv::Mat gray, resized, normalized;

    if (face.channels() == 3) {
        cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = face;
    }

    cv::resize(gray, resized, cv::Size(input_width, input_height));

    // Normalize [0, 1]
    resized.convertTo(normalized, CV_32F, 1.0 / 255.0);

    return cv::dnn::blobFromImage(normalized);
}

EmotionResult FerPlusEmotionScorer::predict(const cv::Mat& face) {
    if (face.empty()) {
        spdlog::warn("Empty face image");
        return EmotionResult{};
    }

    cv::Mat blob = preprocess(face);

    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(inference_mutex);
        net.setInput(blob);
        output = net.forward().clone();
    }

    cv::Mat flat = output.reshape(1, 1);
    std::vector<float> logits(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);
    if (static_cast<int>(logits.size()) != num_classes) {
        throw std::runtime_error("Unexpected emotion output size: " + std::to_string(logits.size()));
    }

    return postprocess(logits);
}

float FerPlusEmotionScorer::happiness(const cv::Mat& face_crop) {
    return predict(face_crop).probability(Emotion::HAPPINESS);
}

EmotionResult FerPlusEmotionScorer::postprocess(const std::vector<float>& logits) {
    EmotionResult result;
    if (logits.empty()) return result;

    // Softmax
    std::vector<float> exp_vals(logits.size());
    float max_logit = *std::max_element(logits.begin(), logits.end());
    float sum_exp = 0.0f;

    for (size_t i = 0; i < logits.size(); i++) {
        exp_vals[i] = std::exp(logits[i] - max_logit);
        sum_exp += exp_vals[i];
    }

    std::vector<float> probs(logits.size());
    for (size_t i = 0; i < logits.size(); i++) {
        probs[i] = exp_vals[i] / sum_exp;
    }

    // Find max
    int max_idx = static_cast<int>(std::distance(probs.begin(),
                                   std::max_element(probs.begin(), probs.end())));

    result.emotion = static_cast<Emotion>(max_idx);
    result.confidence = probs[max_idx];
    result.probabilities = probs;

    return result;
}
