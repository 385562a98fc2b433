// ============= src/clustering/face_crop_writer.cpp =============
#include "clustering/face_crop_writer.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

FaceCropWriter::FaceCropWriter(const std::string& album_dir, const std::string& crop_dirname, int crop_size)
    : crop_dir((fs::path(album_dir) / crop_dirname).string()), crop_size(crop_size)
{
}

std::string FaceCropWriter::crop_name(const FaceRef& ref) {
    std::string base = ref.filename;
    std::replace(base.begin(), base.end(), '.', '_');
    return base + "_" + std::to_string(ref.face_index) + ".jpg";
}

cv::Rect FaceCropWriter::square_region(const BoundingBox& bbox, const cv::Size& image_size) {
    float side = std::max(bbox.width(), bbox.height());
    float cx = (bbox.x1 + bbox.x2) * 0.5f;
    float cy = (bbox.y1 + bbox.y2) * 0.5f;

    BoundingBox square{cx - side * 0.5f, cy - side * 0.5f, cx + side * 0.5f, cy + side * 0.5f};
    return square.to_rect(image_size);
}

void FaceCropWriter::assign_paths(std::vector<PersonCluster>& clusters) const {
    for (auto& c : clusters) {
        c.crop_path = (fs::path(crop_dir) / crop_name(c.representative)).string();
    }
}

int FaceCropWriter::write_all(const std::string& album_dir, std::vector<PersonCluster>& clusters) const {
    std::error_code ec;
    fs::create_directories(crop_dir, ec);
    if (ec) {
        spdlog::error("No se pudo crear {}: {}", crop_dir, ec.message());
        return 0;
    }

    assign_paths(clusters);

    int written = 0;
    std::set<std::string> keep;

    for (const auto& c : clusters) {
        keep.insert(fs::path(c.crop_path).filename().string());

        std::string src = (fs::path(album_dir) / c.representative.filename).string();
        cv::Mat image = cv::imread(src, cv::IMREAD_COLOR);
        if (image.empty()) {
            spdlog::warn("No se pudo leer {} para el crop", src);
            continue;
        }

        cv::Rect roi = square_region(c.representative_bbox, image.size());
        if (roi.empty()) {
            spdlog::warn("Crop vacio para {}#{}", c.representative.filename, c.representative.face_index);
            continue;
        }

        cv::Mat crop;
        cv::resize(image(roi), crop, cv::Size(crop_size, crop_size), 0, 0, cv::INTER_AREA);

        try {
            if (cv::imwrite(c.crop_path, crop)) {
                ++written;
            } else {
                spdlog::warn("No se pudo escribir {}", c.crop_path);
            }
        } catch (const cv::Exception& e) {
            spdlog::warn("imwrite fallo para {}: {}", c.crop_path, e.what());
        }
    }

    // Crops de representantes que ya no existen
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(crop_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (keep.count(it->path().filename().string()) == 0) {
            stale.push_back(it->path());
        }
    }
    for (const auto& p : stale) {
        std::error_code rm_ec;
        fs::remove(p, rm_ec);
    }

    spdlog::debug("Crops: {} escritos en {}", written, crop_dir);
    return written;
}
