// ============= include/analysis/face_analyzer.hpp =============
/*
 * Proveedores de modelos (cajas negras)
 *
 * FaceAnalyzer:  imagen -> rostros {bbox, embedding, pose?, confidence}
 * EmotionScorer: crop de un rostro -> felicidad en [0, 1]
 *
 * Implementaciones concretas: YuNetSFaceAnalyzer, FerPlusEmotionScorer.
 * Los tests usan proveedores falsos.
 */

#pragma once
#include "face_types.hpp"
#include <opencv2/core.hpp>
#include <vector>

class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;

    // Lanza std::exception si falla para esta imagen,
    // photorank::ModelUnavailableError si el modelo no puede ejecutarse.
    virtual std::vector<DetectedFace> analyze(const cv::Mat& image) = 0;
};

class EmotionScorer {
public:
    virtual ~EmotionScorer() = default;

    virtual float happiness(const cv::Mat& face_crop) = 0;
};
