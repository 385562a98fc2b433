// ============= include/analysis/quality_extractor.hpp =============
/*
 * Quality Signal Extractor
 *
 * imagen -> ImageMetadata {blur, faces[]}
 *   por rostro: embedding normalizado, facing, confidence, size_px, smile
 *
 * POLITICAS:
 * - Rostros con lado corto < min_face_size_px se descartan
 * - Sin pose -> pose_fallback_score (unico lugar donde se aplica)
 * - Smile se calcula sobre el crop del rostro, nunca sobre la imagen entera
 * - Error del proveedor en una imagen -> failed=true, 0 rostros, blur igual
 * - ModelUnavailableError no se absorbe: aborta el pipeline
 */

#pragma once
#include "analysis/face_analyzer.hpp"
#include "config/ranking_config.hpp"
#include "face_types.hpp"
#include <memory>
#include <optional>
#include <string>

class QualityExtractor {
private:
    std::shared_ptr<FaceAnalyzer> analyzer;
    std::shared_ptr<EmotionScorer> emotion;   // puede ser null
    ExtractorConfig config;

    float smile_for(const cv::Mat& image, const BoundingBox& bbox) const;

public:
    QualityExtractor(std::shared_ptr<FaceAnalyzer> analyzer,
                     std::shared_ptr<EmotionScorer> emotion,
                     const ExtractorConfig& config);

    // filename/fingerprint quedan vacios: los completa el caller
    ImageMetadata extract(const cv::Mat& image) const;

    // Imagen no decodificable -> failed. filename = nombre del archivo
    ImageMetadata extract_file(const std::string& path) const;

    // Rostros validos (tamaño minimo, embedding normalizado) para queries
    std::vector<DetectedFace> detect_faces(const cv::Mat& image) const;

    const ExtractorConfig& get_config() const { return config; }

    static double blur_score(const cv::Mat& image);
    static float facing_score(const std::optional<HeadPose>& pose, const ExtractorConfig& config);
};
