// ============= src/analysis/quality_extractor.cpp =============
#include "analysis/quality_extractor.hpp"
#include "core/errors.hpp"
#include "core/similarity.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>

QualityExtractor::QualityExtractor(std::shared_ptr<FaceAnalyzer> analyzer,
                                   std::shared_ptr<EmotionScorer> emotion,
                                   const ExtractorConfig& config)
    : analyzer(std::move(analyzer)), emotion(std::move(emotion)), config(config)
{
    if (!this->analyzer) {
        throw photorank::ModelUnavailableError("QualityExtractor requires a face analyzer");
    }
    if (!this->emotion) {
        spdlog::warn("Emotion scorer deshabilitado: smile = 0 para todos los rostros");
    }
}

// ==================== SEÑALES ====================

double QualityExtractor::blur_score(const cv::Mat& image) {
    if (image.empty()) return 0.0;

    cv::Mat gray, lap;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Laplacian(gray, lap, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev);
    return stddev[0] * stddev[0];
}

float QualityExtractor::facing_score(const std::optional<HeadPose>& pose, const ExtractorConfig& config) {
    if (!pose) return config.pose_fallback_score;

    float yaw_excess = (std::abs(pose->yaw) - config.pose_yaw_max_deg) / config.pose_yaw_max_deg;
    float pitch_excess = (std::abs(pose->pitch) - config.pose_pitch_max_deg) / config.pose_pitch_max_deg;
    float excess = std::max({0.0f, yaw_excess, pitch_excess});

    if (!std::isfinite(excess)) return 0.0f;
    return std::max(0.0f, 1.0f - excess);
}

float QualityExtractor::smile_for(const cv::Mat& image, const BoundingBox& bbox) const {
    if (!emotion) return 0.0f;

    cv::Rect roi = bbox.to_rect(image.size());
    if (roi.empty()) return 0.0f;

    try {
        float h = emotion->happiness(image(roi));
        if (!std::isfinite(h)) return 0.0f;
        return std::max(0.0f, std::min(1.0f, h));
    } catch (const std::exception& e) {
        spdlog::warn("Emotion scorer fallo en crop {}x{}: {}", roi.width, roi.height, e.what());
        return 0.0f;
    }
}

// ==================== DETECCION ====================

std::vector<DetectedFace> QualityExtractor::detect_faces(const cv::Mat& image) const {
    std::vector<DetectedFace> valid;
    if (image.empty()) return valid;

    auto detected = analyzer->analyze(image);

    for (auto& face : detected) {
        if (face.bbox.shorter_side() < static_cast<float>(config.min_face_size_px)) {
            spdlog::debug("Rostro descartado: {:.0f}px < {}px",
                          face.bbox.shorter_side(), config.min_face_size_px);
            continue;
        }
        if (face.embedding.empty() || !photorank::l2_normalize(face.embedding)) {
            spdlog::warn("Rostro sin embedding valido descartado");
            continue;
        }
        valid.push_back(std::move(face));
    }

    return valid;
}

ImageMetadata QualityExtractor::extract(const cv::Mat& image) const {
    ImageMetadata meta;

    if (image.empty()) {
        meta.failed = true;
        meta.error = "empty image";
        return meta;
    }

    meta.blur_score = blur_score(image);

    std::vector<DetectedFace> faces;
    try {
        faces = detect_faces(image);
    } catch (const photorank::ModelUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        meta.failed = true;
        meta.error = e.what();
        return meta;
    }

    int index = 0;
    for (auto& face : faces) {
        FaceRecord record;
        record.face_index = index++;
        record.bbox = face.bbox;
        record.facing_score = facing_score(face.pose, config);
        record.confidence = face.confidence;
        record.size_px = face.bbox.shorter_side();
        record.smile_score = smile_for(image, face.bbox);
        record.embedding = std::move(face.embedding);
        meta.faces.push_back(std::move(record));
    }

    return meta;
}

ImageMetadata QualityExtractor::extract_file(const std::string& path) const {
    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        spdlog::warn("imread fallo para {}: {}", path, e.what());
    }

    ImageMetadata meta;
    if (image.empty()) {
        meta.failed = true;
        meta.error = "cannot decode image";
    } else {
        meta = extract(image);
    }

    meta.filename = std::filesystem::path(path).filename().string();
    return meta;
}
