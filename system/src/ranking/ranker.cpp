// ============= src/ranking/ranker.cpp =============
#include "ranking/ranker.hpp"
#include "database/metadata_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

// ==================== SCORING ====================

float normalized_blur(double blur_score, const ScoringConfig& config) {
    if (!(blur_score > 0.0)) return 0.0f;
    return static_cast<float>(std::min(1.0, blur_score / config.blur_normalize_divisor));
}

bool is_good_face(const FaceRecord& face, const ScoringConfig& config) {
    return face.facing_score > config.good_facing_min &&
           face.confidence > config.good_confidence_min;
}

float group_quality(const std::vector<FaceRecord>& faces, const ScoringConfig& config) {
    if (faces.empty()) return 0.0f;

    size_t good = std::count_if(faces.begin(), faces.end(),
                                [&](const FaceRecord& f) { return is_good_face(f, config); });
    return static_cast<float>(good) / static_cast<float>(faces.size());
}

float score_image(const ImageMetadata& image, const FaceRecord& target,
                  const ScoringConfig& config, bool* is_group) {
    const float sharp = normalized_blur(image.blur_score, config);
    const bool group = static_cast<int>(image.faces.size()) >= config.min_faces_for_group;

    if (is_group) *is_group = group;

    if (group) {
        return config.group_quality_weight * group_quality(image.faces, config) +
               config.group_sharpness_weight * sharp;
    }

    return config.single_smile_weight * target.smile_score +
           config.single_facing_weight * target.facing_score +
           config.single_sharpness_weight * sharp;
}

// ==================== RANKER ====================

Ranker::Ranker(const ScoringConfig& config) : config(config) {}

std::vector<RankedPhoto> Ranker::rank(const AlbumMetadata& metadata,
                                      const std::set<FaceRef>& targets,
                                      int top_k) const {
    // Rostro objetivo por foto: el de mayor area (empate -> menor face_index)
    std::map<std::string, const FaceRecord*> target_by_file;

    for (const auto& ref : targets) {
        auto it = metadata.find(ref.filename);
        if (it == metadata.end() || it->second.failed) continue;

        const auto& faces = it->second.faces;
        auto face = std::find_if(faces.begin(), faces.end(),
                                 [&](const FaceRecord& f) { return f.face_index == ref.face_index; });
        if (face == faces.end()) continue;

        const FaceRecord*& current = target_by_file[ref.filename];
        if (!current || face->bbox.area() > current->bbox.area()) {
            current = &*face;
        }
    }

    std::vector<RankedPhoto> ranked;
    ranked.reserve(target_by_file.size());

    for (const auto& [filename, target] : target_by_file) {
        const ImageMetadata& image = metadata.at(filename);

        RankedPhoto photo;
        photo.filename = filename;
        photo.target_face_index = target->face_index;
        photo.score = score_image(image, *target, config, &photo.group);
        ranked.push_back(std::move(photo));
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedPhoto& a, const RankedPhoto& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.filename < b.filename;
    });

    if (top_k > 0 && ranked.size() > static_cast<size_t>(top_k)) {
        ranked.resize(top_k);
    }
    return ranked;
}

std::vector<RankedPhoto> Ranker::rank(const AlbumMetadata& metadata,
                                      const PersonCluster& cluster,
                                      int top_k) const {
    return rank(metadata, cluster.members, top_k);
}

std::vector<RankedPhoto> Ranker::rank_live(const std::string& album_dir,
                                           const QualityExtractor& extractor,
                                           const TargetSelector& select_targets,
                                           int top_k) const {
    auto files = MetadataStore::list_images(album_dir);
    spdlog::info("⚡ Ranking en vivo: {} imagenes en {}", files.size(), album_dir);

    AlbumMetadata live;
    for (const auto& file : files) {
        ImageMetadata meta = extractor.extract_file((fs::path(album_dir) / file).string());
        meta.filename = file;
        if (meta.failed) {
            spdlog::warn("❌ Extraccion fallida {}: {}", file, meta.error);
        }
        live[file] = std::move(meta);
    }

    std::set<FaceRef> targets = select_targets(live);
    spdlog::debug("   {} rostros objetivo en vivo", targets.size());
    return rank(live, targets, top_k);
}
