// ============= include/analysis/emotion_recognizer.hpp =============
/*
 * FER+ Emotion Recognition - OpenCV DNN
 *
 * MODELO: emotion-ferplus-8.onnx
 * - Input: [1, 1, 64, 64] - grayscale, pixel / 255.0
 * - Output: [1, 8] - logits
 *
 * EMOCIONES (índices):
 * 0: neutral
 * 1: happiness
 * 2: surprise
 * 3: sadness
 * 4: anger
 * 5: disgust
 * 6: fear
 * 7: contempt
 *
 * El ranker solo usa la probabilidad de HAPPINESS como smile score.
 */

#pragma once
#include "analysis/face_analyzer.hpp"
#include <opencv2/dnn.hpp>
#include <mutex>
#include <string>
#include <vector>

enum class Emotion {
    NEUTRAL = 0,
    HAPPINESS = 1,
    SURPRISE = 2,
    SADNESS = 3,
    ANGER = 4,
    DISGUST = 5,
    FEAR = 6,
    CONTEMPT = 7
};

struct EmotionResult {
    Emotion emotion = Emotion::NEUTRAL;
    float confidence = 0.0f;
    std::vector<float> probabilities;  // Para todas las emociones

    float probability(Emotion e) const;
    std::string to_string() const;
};

class FerPlusEmotionScorer : public EmotionScorer {
private:
    cv::dnn::Net net;
    std::mutex inference_mutex;

    int input_width = 64;
    int input_height = 64;
    int num_classes = 8;

    cv::Mat preprocess(const cv::Mat& face) const;

public:
    // Lanza photorank::ModelUnavailableError si el modelo no carga
    explicit FerPlusEmotionScorer(const std::string& model_path);

    EmotionResult predict(const cv::Mat& face);

    // Probabilidad de HAPPINESS en [0, 1]
    float happiness(const cv::Mat& face_crop) override;

    // Softmax sobre los logits
    static EmotionResult postprocess(const std::vector<float>& logits);
};

// Helper: convertir enum a string
std::string emotion_to_string(Emotion emotion);
