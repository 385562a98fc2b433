// ============= include/analysis/yunet_sface_analyzer.hpp =============
/*
 * YuNet (deteccion) + SFace (embedding) via OpenCV objdetect
 *
 * MODELOS:
 * - face_detection_yunet_2023mar.onnx
 *   Output por rostro: [x, y, w, h, 5 landmarks (x,y), score] = 15 floats
 *   Landmarks: ojo der, ojo izq, nariz, boca der, boca izq
 * - face_recognition_sface_2021dec.onnx
 *   alignCrop 112x112 -> embedding 128-d
 *
 * POSE: estimada a partir de los 5 landmarks (no hay modelo 3-D).
 *
 * Thread-safe: una inferencia a la vez (mutex interno).
 */

#pragma once
#include "analysis/face_analyzer.hpp"
#include "config/ranking_config.hpp"
#include <opencv2/objdetect.hpp>
#include <array>
#include <mutex>
#include <optional>

class YuNetSFaceAnalyzer : public FaceAnalyzer {
private:
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    cv::Size input_size{0, 0};
    std::mutex inference_mutex;

public:
    // Lanza photorank::ModelUnavailableError si algun modelo no carga
    explicit YuNetSFaceAnalyzer(const ModelConfig& config);

    std::vector<DetectedFace> analyze(const cv::Mat& image) override;

    // landmarks: ojo der, ojo izq, nariz, boca der, boca izq
    // nullopt si los landmarks son degenerados (ojos o boca colapsados)
    static std::optional<HeadPose> estimate_pose(const std::array<cv::Point2f, 5>& landmarks);
};
