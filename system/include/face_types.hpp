// ============= include/face_types.hpp =============
/*
 * Tipos compartidos del motor photorank
 *
 * FLUJO:
 *   imagen -> DetectedFace (proveedor) -> FaceRecord (cache)
 *          -> PersonCluster (por album) -> GlobalPerson (registry)
 *
 * Todos los embeddings estan L2-normalizados: cosine == dot product.
 */

#pragma once
#include <opencv2/core.hpp>
#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

// ==================== GEOMETRIA ====================

struct BoundingBox {
    float x1 = 0, y1 = 0, x2 = 0, y2 = 0;

    float width() const { return std::max(0.0f, x2 - x1); }
    float height() const { return std::max(0.0f, y2 - y1); }
    float area() const { return width() * height(); }
    float shorter_side() const { return std::min(width(), height()); }

    // Rect entero recortado a los limites de la imagen (puede quedar vacio)
    cv::Rect to_rect(const cv::Size& image_size) const {
        cv::Rect r(cv::Point(static_cast<int>(x1), static_cast<int>(y1)),
                   cv::Point(static_cast<int>(x2), static_cast<int>(y2)));
        return r & cv::Rect(0, 0, image_size.width, image_size.height);
    }
};

struct HeadPose {
    float yaw = 0;     // grados, izquierda/derecha
    float pitch = 0;   // grados, arriba/abajo
    float roll = 0;
};

// ==================== SALIDA DEL PROVEEDOR ====================

struct DetectedFace {
    BoundingBox bbox;
    std::vector<float> embedding;
    std::optional<HeadPose> pose;
    float confidence = 0;
};

// ==================== CACHE POR ALBUM ====================

struct FaceRecord {
    int face_index = 0;
    BoundingBox bbox;
    std::vector<float> embedding;
    float facing_score = 0;
    float confidence = 0;
    float size_px = 0;      // lado corto del bbox
    float smile_score = 0;
};

struct ImageMetadata {
    std::string filename;
    std::string fingerprint;
    double blur_score = 0;
    std::vector<FaceRecord> faces;

    bool failed = false;
    std::string error;
};

using AlbumMetadata = std::map<std::string, ImageMetadata>;

// ==================== IDENTIDADES ====================

struct FaceRef {
    std::string filename;
    int face_index = 0;

    bool operator<(const FaceRef& other) const {
        return std::tie(filename, face_index) < std::tie(other.filename, other.face_index);
    }
    bool operator==(const FaceRef& other) const {
        return filename == other.filename && face_index == other.face_index;
    }
};

struct PersonCluster {
    int cluster_index = 0;
    FaceRef representative;
    std::vector<float> representative_embedding;
    BoundingBox representative_bbox;
    std::set<FaceRef> members;
    std::optional<std::string> global_id;
    std::string crop_path;

    size_t photo_count() const {
        std::set<std::string> files;
        for (const auto& m : members) files.insert(m.filename);
        return files.size();
    }
};

struct GlobalPerson {
    std::string id;
    std::string name;
    std::vector<float> representative_embedding;
    std::string crop_ref;
    int64_t created_seq = 0;
    int64_t created_at = 0;   // epoch segundos
};

// Snapshot inmutable de un album servido a los lectores
struct AlbumView {
    std::string album_id;
    std::string album_dir;
    std::shared_ptr<const AlbumMetadata> metadata;
    std::vector<PersonCluster> clusters;
};
