// ============= test/test_helpers.hpp =============
/*
 * Utilidades compartidas por los tests de photorank
 *
 * - TempDir: directorio temporal que se borra al salir
 * - FakeFaceAnalyzer: rostros predefinidos por ANCHO de imagen
 * - FakeEmotionScorer: felicidad fija, registra los crops recibidos
 * - Embeddings sinteticos con cosine similarity exacta
 */

#pragma once
#include "analysis/face_analyzer.hpp"
#include "core/errors.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace photorank_test {

namespace fs = std::filesystem;

constexpr int EMB_DIM = 8;

// ==================== FILESYSTEM ====================

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path = fs::temp_directory_path() /
               ("photorank_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path.string(); }
    std::string file(const std::string& name) const { return (path / name).string(); }

    fs::path path;
};

// Imagen con ruido (nitida) o plana (blur = 0). El ancho identifica la imagen
inline cv::Mat make_image(int width, int height = 240, bool sharp = true, unsigned seed = 7) {
    cv::Mat img(height, width, CV_8UC3, cv::Scalar(120, 120, 120));
    if (sharp) {
        cv::RNG rng(seed);
        rng.fill(img, cv::RNG::UNIFORM, 0, 255);
    }
    return img;
}

inline void write_image(const std::string& path, int width, int height = 240,
                        bool sharp = true, unsigned seed = 7) {
    if (!cv::imwrite(path, make_image(width, height, sharp, seed))) {
        throw std::runtime_error("cannot write test image " + path);
    }
}

// Fuerza un fingerprint distinto aunque el tamaño no cambie
inline void touch_later(const std::string& path, int seconds = 10) {
    auto t = fs::last_write_time(path);
    fs::last_write_time(path, t + std::chrono::seconds(seconds));
}

inline std::vector<char> read_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline void write_garbage(const std::string& path, const std::string& content = "not a real file") {
    std::ofstream file(path, std::ios::binary);
    file << content;
}

// ==================== EMBEDDINGS ====================

inline std::vector<float> axis(int i) {
    std::vector<float> v(EMB_DIM, 0.0f);
    v[i % EMB_DIM] = 1.0f;
    return v;
}

// cos(resultado, axis(a)) == cos_to_a exactamente; el resto va hacia axis(b)
inline std::vector<float> blend(int a, int b, float cos_to_a) {
    std::vector<float> v(EMB_DIM, 0.0f);
    v[a % EMB_DIM] = cos_to_a;
    v[b % EMB_DIM] = std::sqrt(std::max(0.0f, 1.0f - cos_to_a * cos_to_a));
    return v;
}

inline DetectedFace face(float x, float y, float size, const std::vector<float>& emb,
                         float confidence = 0.95f, bool with_pose = true, float yaw = 0.0f) {
    DetectedFace f;
    f.bbox = BoundingBox{x, y, x + size, y + size};
    f.embedding = emb;
    f.confidence = confidence;
    if (with_pose) f.pose = HeadPose{yaw, 0.0f, 0.0f};
    return f;
}

// ==================== PROVEEDORES FALSOS ====================

class FakeFaceAnalyzer : public FaceAnalyzer {
public:
    std::vector<DetectedFace> analyze(const cv::Mat& image) override {
        calls++;
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (unavailable) {
            throw photorank::ModelUnavailableError("fake model offline");
        }
        if (failing.count(image.cols)) {
            throw std::runtime_error("fake detector failure");
        }

        auto it = faces.find(image.cols);
        return it != faces.end() ? it->second : std::vector<DetectedFace>{};
    }

    void set(int width, std::vector<DetectedFace> list) {
        std::lock_guard<std::mutex> lock(mutex);
        faces[width] = std::move(list);
    }

    void fail_on(int width) {
        std::lock_guard<std::mutex> lock(mutex);
        failing[width] = true;
    }

    void set_unavailable(bool value) {
        std::lock_guard<std::mutex> lock(mutex);
        unavailable = value;
    }

    std::atomic<int> calls{0};
    std::atomic<int> delay_ms{0};

private:
    std::mutex mutex;
    std::map<int, std::vector<DetectedFace>> faces;
    std::map<int, bool> failing;
    bool unavailable = false;
};

class FakeEmotionScorer : public EmotionScorer {
public:
    explicit FakeEmotionScorer(float value = 0.8f) : value(value) {}

    float happiness(const cv::Mat& face_crop) override {
        std::lock_guard<std::mutex> lock(mutex);
        crop_sizes.push_back(face_crop.size());
        if (throws) throw std::runtime_error("fake emotion failure");
        return value;
    }

    std::vector<cv::Size> crops() {
        std::lock_guard<std::mutex> lock(mutex);
        return crop_sizes;
    }

    float value;
    bool throws = false;

private:
    std::mutex mutex;
    std::vector<cv::Size> crop_sizes;
};

} // namespace photorank_test
