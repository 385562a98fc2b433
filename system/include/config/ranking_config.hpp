// ============= include/config/ranking_config.hpp =============
/*
 * Configuracion tipada del motor de ranking.
 *
 * SECCIONES (config.toml):
 * [extractor]  tamaño minimo de rostro, limites de pose, crops
 * [models]     rutas ONNX de detector / recognizer / emociones
 * [clustering] umbral de cosine similarity por album
 * [matching]   umbrales de link global y busqueda por foto
 * [scoring]    pesos y umbrales del ranker
 * [storage]    directorios y nombres de archivos persistidos
 * [service]    threads del pool de sincronizacion
 * [logging]    nivel, patron y archivo de spdlog
 *
 * Los valores por defecto vienen de config.hpp (namespace Config).
 */

#pragma once
#include "config.hpp"
#include <string>

class SimpleToml;

struct ExtractorConfig {
    int min_face_size_px = Config::MIN_FACE_SIZE_PX;
    float pose_yaw_max_deg = Config::POSE_YAW_MAX_DEG;
    float pose_pitch_max_deg = Config::POSE_PITCH_MAX_DEG;
    float pose_fallback_score = Config::POSE_FALLBACK_SCORE;
    int crop_size = Config::FACE_CROP_SIZE;
};

struct ModelConfig {
    std::string detector_path = Config::DEFAULT_DETECTOR_MODEL;
    std::string recognizer_path = Config::DEFAULT_RECOGNIZER_MODEL;
    std::string emotion_path = Config::DEFAULT_EMOTION_MODEL;
    bool emotion_enabled = true;
    float detector_score_threshold = Config::DETECTOR_SCORE_THRESHOLD;
};

struct ClusteringConfig {
    float threshold = Config::CLUSTER_THRESHOLD;
};

struct MatchingConfig {
    float link_threshold = Config::LINK_THRESHOLD;
    float find_threshold = Config::FIND_THRESHOLD;
    int top_k = Config::FIND_TOP_K;
};

struct ScoringConfig {
    float blur_normalize_divisor = Config::BLUR_NORMALIZE_DIVISOR;
    int min_faces_for_group = Config::MIN_FACES_FOR_GROUP;
    float good_facing_min = Config::GOOD_FACING_MIN;
    float good_confidence_min = Config::GOOD_CONFIDENCE_MIN;

    float single_smile_weight = Config::WEIGHT_SINGLE_SMILE;
    float single_facing_weight = Config::WEIGHT_SINGLE_FACING;
    float single_sharpness_weight = Config::WEIGHT_SINGLE_SHARPNESS;
    float group_quality_weight = Config::WEIGHT_GROUP_QUALITY;
    float group_sharpness_weight = Config::WEIGHT_GROUP_SHARPNESS;

    int default_top_k = Config::DEFAULT_TOP_K;
};

struct StorageConfig {
    std::string data_dir = Config::DEFAULT_DATA_DIR;
    std::string albums_dir = Config::DEFAULT_ALBUMS_DIR;
    std::string cache_filename = Config::CACHE_FILENAME;
    std::string crop_dir = Config::FACE_CROP_DIR;
    std::string registry_filename = Config::REGISTRY_FILENAME;
    std::string global_crop_dir = Config::GLOBAL_CROP_DIR;
};

struct ServiceConfig {
    int worker_threads = Config::WORKER_THREADS;
};

struct LoggingConfig {
    std::string level = Config::LOG_LEVEL;
    std::string pattern = Config::LOG_PATTERN;
    std::string file;   // vacio = solo consola
};

struct RankingConfig {
    ExtractorConfig extractor;
    ModelConfig models;
    ClusteringConfig clustering;
    MatchingConfig matching;
    ScoringConfig scoring;
    StorageConfig storage;
    ServiceConfig service;
    LoggingConfig logging;

    // Archivo ausente -> defaults (con warning). Lanza ConfigError si validate() falla.
    static RankingConfig load(const std::string& path);
    static RankingConfig from_toml(const SimpleToml& toml);

    void validate() const;
};
