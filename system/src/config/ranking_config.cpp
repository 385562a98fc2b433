// ============= src/config/ranking_config.cpp =============
#include "config/ranking_config.hpp"
#include "config/simple_toml.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

RankingConfig RankingConfig::load(const std::string& path) {
    SimpleToml toml;
    if (!toml.load(path)) {
        spdlog::warn("⚠️  No se pudo cargar {}, usando valores por defecto", path);
        RankingConfig defaults;
        defaults.validate();
        return defaults;
    }

    spdlog::debug("Config {} cargado ({} claves)", path, toml.size());
    return from_toml(toml);
}

RankingConfig RankingConfig::from_toml(const SimpleToml& toml) {
    RankingConfig cfg;

    // [extractor]
    cfg.extractor.min_face_size_px = toml.get_int("extractor.min_face_size_px", cfg.extractor.min_face_size_px);
    cfg.extractor.pose_yaw_max_deg = toml.get_float("extractor.pose_yaw_max_deg", cfg.extractor.pose_yaw_max_deg);
    cfg.extractor.pose_pitch_max_deg = toml.get_float("extractor.pose_pitch_max_deg", cfg.extractor.pose_pitch_max_deg);
    cfg.extractor.pose_fallback_score = toml.get_float("extractor.pose_fallback_score", cfg.extractor.pose_fallback_score);
    cfg.extractor.crop_size = toml.get_int("extractor.crop_size", cfg.extractor.crop_size);

    // [models]
    cfg.models.detector_path = toml.get("models.detector_path", cfg.models.detector_path);
    cfg.models.recognizer_path = toml.get("models.recognizer_path", cfg.models.recognizer_path);
    cfg.models.emotion_path = toml.get("models.emotion_path", cfg.models.emotion_path);
    cfg.models.emotion_enabled = toml.get_bool("models.emotion_enabled", cfg.models.emotion_enabled);
    cfg.models.detector_score_threshold = toml.get_float("models.detector_score_threshold",
                                                         cfg.models.detector_score_threshold);

    // [clustering]
    cfg.clustering.threshold = toml.get_float("clustering.threshold", cfg.clustering.threshold);

    // [matching]
    cfg.matching.link_threshold = toml.get_float("matching.link_threshold", cfg.matching.link_threshold);
    cfg.matching.find_threshold = toml.get_float("matching.find_threshold", cfg.matching.find_threshold);
    cfg.matching.top_k = toml.get_int("matching.top_k", cfg.matching.top_k);

    // [scoring]
    auto& s = cfg.scoring;
    s.blur_normalize_divisor = toml.get_float("scoring.blur_normalize_divisor", s.blur_normalize_divisor);
    s.min_faces_for_group = toml.get_int("scoring.min_faces_for_group", s.min_faces_for_group);
    s.good_facing_min = toml.get_float("scoring.good_facing_min", s.good_facing_min);
    s.good_confidence_min = toml.get_float("scoring.good_confidence_min", s.good_confidence_min);
    s.single_smile_weight = toml.get_float("scoring.single_smile_weight", s.single_smile_weight);
    s.single_facing_weight = toml.get_float("scoring.single_facing_weight", s.single_facing_weight);
    s.single_sharpness_weight = toml.get_float("scoring.single_sharpness_weight", s.single_sharpness_weight);
    s.group_quality_weight = toml.get_float("scoring.group_quality_weight", s.group_quality_weight);
    s.group_sharpness_weight = toml.get_float("scoring.group_sharpness_weight", s.group_sharpness_weight);
    s.default_top_k = toml.get_int("scoring.default_top_k", s.default_top_k);

    // [storage]
    cfg.storage.data_dir = toml.get("storage.data_dir", cfg.storage.data_dir);
    cfg.storage.albums_dir = toml.get("storage.albums_dir", cfg.storage.albums_dir);
    cfg.storage.cache_filename = toml.get("storage.cache_filename", cfg.storage.cache_filename);
    cfg.storage.crop_dir = toml.get("storage.crop_dir", cfg.storage.crop_dir);
    cfg.storage.registry_filename = toml.get("storage.registry_filename", cfg.storage.registry_filename);
    cfg.storage.global_crop_dir = toml.get("storage.global_crop_dir", cfg.storage.global_crop_dir);

    // [service]
    cfg.service.worker_threads = toml.get_int("service.worker_threads", cfg.service.worker_threads);

    // [logging]
    cfg.logging.level = toml.get("logging.level", cfg.logging.level);
    cfg.logging.pattern = toml.get("logging.pattern", cfg.logging.pattern);
    cfg.logging.file = toml.get("logging.file", cfg.logging.file);

    cfg.validate();
    return cfg;
}

namespace {

void require(bool ok, const std::string& what) {
    if (!ok) {
        throw photorank::ConfigError("Invalid config: " + what);
    }
}

bool in_similarity_range(float v) {
    return v >= -1.0f && v <= 1.0f;
}

} // namespace

void RankingConfig::validate() const {
    require(extractor.min_face_size_px > 0, "extractor.min_face_size_px must be > 0");
    require(extractor.pose_yaw_max_deg > 0.0f, "extractor.pose_yaw_max_deg must be > 0");
    require(extractor.pose_pitch_max_deg > 0.0f, "extractor.pose_pitch_max_deg must be > 0");
    require(extractor.pose_fallback_score >= 0.0f && extractor.pose_fallback_score <= 1.0f,
            "extractor.pose_fallback_score must be in [0, 1]");
    require(extractor.crop_size > 0, "extractor.crop_size must be > 0");

    require(in_similarity_range(clustering.threshold), "clustering.threshold must be in [-1, 1]");
    require(in_similarity_range(matching.link_threshold), "matching.link_threshold must be in [-1, 1]");
    require(in_similarity_range(matching.find_threshold), "matching.find_threshold must be in [-1, 1]");
    require(matching.top_k > 0, "matching.top_k must be > 0");

    require(scoring.blur_normalize_divisor > 0.0f, "scoring.blur_normalize_divisor must be > 0");
    require(scoring.min_faces_for_group >= 2, "scoring.min_faces_for_group must be >= 2");
    require(scoring.single_smile_weight >= 0.0f && scoring.single_facing_weight >= 0.0f &&
            scoring.single_sharpness_weight >= 0.0f && scoring.group_quality_weight >= 0.0f &&
            scoring.group_sharpness_weight >= 0.0f,
            "scoring weights must be non-negative");

    require(!storage.data_dir.empty(), "storage.data_dir is empty");
    require(!storage.albums_dir.empty(), "storage.albums_dir is empty");
    require(!storage.cache_filename.empty() && storage.cache_filename[0] == '.',
            "storage.cache_filename must be a dot-file");
    require(!storage.crop_dir.empty() && storage.crop_dir[0] == '.',
            "storage.crop_dir must be a dot-directory");
    require(!storage.registry_filename.empty(), "storage.registry_filename is empty");

    require(service.worker_threads > 0, "service.worker_threads must be > 0");
}
