// ============= tools/query_cache.cpp =============
/*
 * Herramienta de consulta para el cache de un album (.photorank_cache.db)
 *
 * EJEMPLOS DE USO:
 * ./query_cache user-data/albums/boda/.photorank_cache.db --stats
 * ./query_cache .photorank_cache.db --image IMG_0042.jpg
 * ./query_cache .photorank_cache.db --failed
 * ./query_cache .photorank_cache.db --export faces.csv
 */

#include "config.hpp"
#include "database/metadata_store.hpp"
#include "database/sqlite_document.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

class CacheQueryTool {
private:
    std::string cache_path;
    AlbumMetadata entries;

public:
    explicit CacheQueryTool(const std::string& path) : cache_path(path) {
        if (!MetadataStore::read_cache(path, entries)) {
            throw std::runtime_error("Cache ilegible o version incompatible: " + path);
        }
    }

    void show_statistics() {
        size_t faces = 0, failed = 0, with_faces = 0;
        double blur_sum = 0;
        float smile_sum = 0, facing_sum = 0;

        for (const auto& [name, meta] : entries) {
            if (meta.failed) failed++;
            if (!meta.faces.empty()) with_faces++;
            blur_sum += meta.blur_score;
            for (const auto& f : meta.faces) {
                faces++;
                smile_sum += f.smile_score;
                facing_sum += f.facing_score;
            }
        }

        SqliteDocument doc;
        std::string format, dim;
        if (doc.open_readonly(cache_path)) {
            format = doc.meta("format") + " v" + doc.meta("version");
            dim = doc.meta("embedding_dim");
        }

        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS DEL CACHE" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Formato:            " << format << std::endl;
        std::cout << "Embedding dim:      " << dim << std::endl;
        std::cout << "Imágenes:           " << entries.size() << std::endl;
        std::cout << "Con rostros:        " << with_faces << std::endl;
        std::cout << "Fallidas:           " << failed << std::endl;
        std::cout << "Rostros:            " << faces << std::endl;

        std::cout << std::fixed << std::setprecision(3);
        if (!entries.empty()) {
            std::cout << "Blur promedio:      " << blur_sum / entries.size() << std::endl;
        }
        if (faces > 0) {
            std::cout << "Smile promedio:     " << smile_sum / faces << std::endl;
            std::cout << "Facing promedio:    " << facing_sum / faces << std::endl;
        }
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    void print_image(const std::string& filename) {
        auto it = entries.find(filename);
        if (it == entries.end()) {
            std::cout << "No hay entrada para " << filename << std::endl;
            return;
        }

        const auto& meta = it->second;
        std::cout << meta.filename << "  fp=" << meta.fingerprint
                  << "  blur=" << std::fixed << std::setprecision(1) << meta.blur_score;
        if (meta.failed) std::cout << "  FALLIDA: " << meta.error;
        std::cout << std::endl;

        std::cout << std::left
                  << std::setw(6) << "IDX"
                  << std::setw(24) << "BBOX"
                  << std::setw(10) << "SIZE"
                  << std::setw(10) << "FACING"
                  << std::setw(10) << "CONF"
                  << std::setw(10) << "SMILE" << std::endl;
        std::cout << std::string(70, '-') << std::endl;

        for (const auto& f : meta.faces) {
            std::string bbox = std::to_string(static_cast<int>(f.bbox.x1)) + "," +
                               std::to_string(static_cast<int>(f.bbox.y1)) + " " +
                               std::to_string(static_cast<int>(f.bbox.width())) + "x" +
                               std::to_string(static_cast<int>(f.bbox.height()));
            std::cout << std::left << std::setprecision(3)
                      << std::setw(6) << f.face_index
                      << std::setw(24) << bbox
                      << std::setw(10) << f.size_px
                      << std::setw(10) << f.facing_score
                      << std::setw(10) << f.confidence
                      << std::setw(10) << f.smile_score << std::endl;
        }
    }

    void print_failed() {
        for (const auto& [name, meta] : entries) {
            if (meta.failed) {
                std::cout << name << ": " << meta.error << std::endl;
            }
        }
    }

    void export_csv(const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            std::cerr << "No se pudo crear: " << filename << std::endl;
            return;
        }

        file << "filename,face_index,x1,y1,x2,y2,size_px,facing,confidence,smile,blur\n";
        for (const auto& [name, meta] : entries) {
            for (const auto& f : meta.faces) {
                file << name << "," << f.face_index << ","
                     << f.bbox.x1 << "," << f.bbox.y1 << "," << f.bbox.x2 << "," << f.bbox.y2 << ","
                     << f.size_px << "," << f.facing_score << "," << f.confidence << ","
                     << f.smile_score << "," << meta.blur_score << "\n";
            }
        }

        std::cout << "Exportado a: " << filename << std::endl;
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <" << Config::CACHE_FILENAME << "> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Mostrar estadísticas generales\n";
    std::cout << "  --image FILENAME            Rostros y señales de una imagen\n";
    std::cout << "  --failed                    Imágenes con extracción fallida\n";
    std::cout << "  --export FILENAME.csv       Exportar rostros a CSV\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_pattern(Config::LOG_PATTERN);

    try {
        CacheQueryTool tool(argv[1]);

        bool any = false;
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--stats") {
                tool.show_statistics();
                any = true;
            }
            else if (arg == "--image" && i + 1 < argc) {
                tool.print_image(argv[++i]);
                any = true;
            }
            else if (arg == "--failed") {
                tool.print_failed();
                any = true;
            }
            else if (arg == "--export" && i + 1 < argc) {
                tool.export_csv(argv[++i]);
                any = true;
            }
        }

        if (!any) tool.show_statistics();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
