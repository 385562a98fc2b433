// ============= include/config.hpp =============
#pragma once

namespace Config {

    // Extraccion de señales
    constexpr int MIN_FACE_SIZE_PX = 30;
    constexpr float POSE_YAW_MAX_DEG = 15.0f;
    constexpr float POSE_PITCH_MAX_DEG = 15.0f;
    constexpr float POSE_FALLBACK_SCORE = 0.5f;
    constexpr int FACE_CROP_SIZE = 256;

    // Modelos
    constexpr const char* DEFAULT_DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr const char* DEFAULT_EMOTION_MODEL = "models/emotion-ferplus-8.onnx";
    constexpr float DETECTOR_SCORE_THRESHOLD = 0.6f;

    // Clustering / matching (cosine similarity)
    constexpr float CLUSTER_THRESHOLD = 0.45f;
    constexpr float LINK_THRESHOLD = 0.55f;
    constexpr float FIND_THRESHOLD = 0.45f;
    constexpr int FIND_TOP_K = 3;

    // Scoring
    constexpr float BLUR_NORMALIZE_DIVISOR = 500.0f;
    constexpr int MIN_FACES_FOR_GROUP = 2;
    constexpr float GOOD_FACING_MIN = 0.45f;
    constexpr float GOOD_CONFIDENCE_MIN = 0.7f;

    constexpr float WEIGHT_SINGLE_SMILE = 0.4f;
    constexpr float WEIGHT_SINGLE_FACING = 0.3f;
    constexpr float WEIGHT_SINGLE_SHARPNESS = 0.3f;
    constexpr float WEIGHT_GROUP_QUALITY = 0.7f;
    constexpr float WEIGHT_GROUP_SHARPNESS = 0.3f;

    constexpr int DEFAULT_TOP_K = 200;

    // Storage
    constexpr const char* DEFAULT_DATA_DIR = "user-data";
    constexpr const char* DEFAULT_ALBUMS_DIR = "user-data/albums";
    constexpr const char* CACHE_FILENAME = ".photorank_cache.db";
    constexpr const char* FACE_CROP_DIR = ".photorank_faces";
    constexpr const char* REGISTRY_FILENAME = "people.db";
    constexpr const char* GLOBAL_CROP_DIR = "faces";

    constexpr const char* CACHE_FORMAT = "photorank-album-cache";
    constexpr const char* REGISTRY_FORMAT = "photorank-registry";
    constexpr int CACHE_FORMAT_VERSION = 1;
    constexpr int REGISTRY_FORMAT_VERSION = 1;

    // Service
    constexpr int WORKER_THREADS = 2;

    // Logging
    constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
    constexpr const char* LOG_LEVEL = "info";
}
