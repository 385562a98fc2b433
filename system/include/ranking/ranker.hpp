// ============= include/ranking/ranker.hpp =============
/*
 * Ranker - ordena las fotos de una persona por calidad
 *
 * SCORE:
 *   normalized_blur = min(1, blur / blur_normalize_divisor)
 *
 *   single (rostros < min_faces_for_group):
 *     w_smile*smile + w_facing*facing + w_sharp*normalized_blur   (rostro objetivo)
 *
 *   group:
 *     w_group*fraction_good + w_sharp_group*normalized_blur
 *     good = facing > good_facing_min && confidence > good_confidence_min
 *
 * Orden: score desc, filename asc. top_k <= 0 -> todas.
 * Si varios rostros de la persona caen en la misma foto, el mas grande es el objetivo.
 */

#pragma once
#include "analysis/quality_extractor.hpp"
#include "config/ranking_config.hpp"
#include "face_types.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

struct RankedPhoto {
    std::string filename;
    float score = 0.0f;
    int target_face_index = 0;
    bool group = false;
};

float normalized_blur(double blur_score, const ScoringConfig& config);
bool is_good_face(const FaceRecord& face, const ScoringConfig& config);
float group_quality(const std::vector<FaceRecord>& faces, const ScoringConfig& config);

// Score de una imagen con su rostro objetivo; is_group (opcional) indica el modo usado
float score_image(const ImageMetadata& image, const FaceRecord& target,
                  const ScoringConfig& config, bool* is_group = nullptr);

class Ranker {
private:
    ScoringConfig config;

public:
    explicit Ranker(const ScoringConfig& config);

    std::vector<RankedPhoto> rank(const AlbumMetadata& metadata,
                                  const std::set<FaceRef>& targets,
                                  int top_k) const;

    std::vector<RankedPhoto> rank(const AlbumMetadata& metadata,
                                  const PersonCluster& cluster,
                                  int top_k) const;

    // Elige los rostros objetivo sobre la metadata recien extraida
    using TargetSelector = std::function<std::set<FaceRef>(const AlbumMetadata&)>;

    // Re-extrae todas las imagenes del album; los objetivos salen del selector,
    // que debe elegirlos igual que el modo cache (mismo clustering)
    std::vector<RankedPhoto> rank_live(const std::string& album_dir,
                                       const QualityExtractor& extractor,
                                       const TargetSelector& select_targets,
                                       int top_k) const;

    const ScoringConfig& get_config() const { return config; }
};
