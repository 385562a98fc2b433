// ============= src/analysis/yunet_sface_analyzer.cpp =============
#include "analysis/yunet_sface_analyzer.hpp"
#include "core/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

constexpr float RAD2DEG = 180.0f / static_cast<float>(CV_PI);

// Proporcion vertical nariz entre ojos y boca en un rostro frontal
constexpr float FRONTAL_NOSE_RATIO = 0.55f;

float clamp_unit(float v) {
    return std::max(-1.0f, std::min(1.0f, v));
}

} // namespace

YuNetSFaceAnalyzer::YuNetSFaceAnalyzer(const ModelConfig& config) {
    spdlog::info("🧠 Inicializando YuNet + SFace");
    spdlog::info("   Detector:   {}", config.detector_path);
    spdlog::info("   Recognizer: {}", config.recognizer_path);

    for (const auto& path : {config.detector_path, config.recognizer_path}) {
        if (!fs::exists(path)) {
            throw photorank::ModelUnavailableError("Model not found: " + path);
        }
    }

    try {
        detector = cv::FaceDetectorYN::create(
            config.detector_path, "", cv::Size(320, 320),
            config.detector_score_threshold, 0.3f, 5000);
        recognizer = cv::FaceRecognizerSF::create(config.recognizer_path, "");
    } catch (const cv::Exception& e) {
        throw photorank::ModelUnavailableError(std::string("Cannot load face models: ") + e.what());
    }

    if (!detector || !recognizer) {
        throw photorank::ModelUnavailableError("Face models not ready");
    }

    spdlog::info("✓ Face analyzer ready (score thr {:.2f})", config.detector_score_threshold);
}

std::vector<DetectedFace> YuNetSFaceAnalyzer::analyze(const cv::Mat& image) {
    std::vector<DetectedFace> out;
    if (image.empty()) return out;

    std::lock_guard<std::mutex> lock(inference_mutex);

    // YuNet requiere el tamaño exacto de la imagen
    if (image.size() != input_size) {
        detector->setInputSize(image.size());
        input_size = image.size();
    }

    cv::Mat dets;
    detector->detect(image, dets);
    if (dets.empty() || dets.cols < 15) return out;

    for (int i = 0; i < dets.rows; ++i) {
        const float x = dets.at<float>(i, 0);
        const float y = dets.at<float>(i, 1);
        const float w = dets.at<float>(i, 2);
        const float h = dets.at<float>(i, 3);

        DetectedFace face;
        face.bbox = BoundingBox{x, y, x + w, y + h};
        face.confidence = dets.at<float>(i, 14);

        std::array<cv::Point2f, 5> lmk;
        for (int k = 0; k < 5; ++k) {
            lmk[k] = cv::Point2f(dets.at<float>(i, 4 + 2 * k), dets.at<float>(i, 5 + 2 * k));
        }
        face.pose = estimate_pose(lmk);

        cv::Mat aligned, feature;
        recognizer->alignCrop(image, dets.row(i), aligned);
        recognizer->feature(aligned, feature);

        cv::Mat flat = feature.reshape(1, 1);
        face.embedding.assign(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);

        out.push_back(std::move(face));
    }

    return out;
}

std::optional<HeadPose> YuNetSFaceAnalyzer::estimate_pose(const std::array<cv::Point2f, 5>& landmarks) {
    const cv::Point2f& eye_a = landmarks[0];
    const cv::Point2f& eye_b = landmarks[1];
    const cv::Point2f& nose = landmarks[2];
    const cv::Point2f mouth = (landmarks[3] + landmarks[4]) * 0.5f;
    const cv::Point2f eye_mid = (eye_a + eye_b) * 0.5f;

    HeadPose pose;

    cv::Point2f eye_vec = eye_b - eye_a;
    pose.roll = std::atan2(eye_vec.y, eye_vec.x) * RAD2DEG;

    // Quitar roll: rotar alrededor del punto medio de los ojos
    const float c = std::cos(-pose.roll / RAD2DEG);
    const float s = std::sin(-pose.roll / RAD2DEG);
    auto derotate = [&](const cv::Point2f& p) {
        cv::Point2f d = p - eye_mid;
        return cv::Point2f(d.x * c - d.y * s, d.x * s + d.y * c);
    };

    const cv::Point2f n = derotate(nose);
    const cv::Point2f m = derotate(mouth);

    const float half_eye = static_cast<float>(cv::norm(eye_vec)) * 0.5f;
    if (half_eye <= 1e-3f || m.y <= 1e-3f) {
        return std::nullopt;
    }

    // Yaw: desplazamiento horizontal de la nariz respecto al centro de los ojos
    pose.yaw = std::asin(clamp_unit(n.x / half_eye)) * RAD2DEG;

    // Pitch: posicion vertical de la nariz entre ojos (0) y boca (1)
    const float ratio = n.y / m.y;
    pose.pitch = std::asin(clamp_unit((ratio - FRONTAL_NOSE_RATIO) * 2.0f)) * RAD2DEG;

    return pose;
}
