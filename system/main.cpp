// ============= main.cpp - photorank CLI =============
#include "analysis/emotion_recognizer.hpp"
#include "analysis/quality_extractor.hpp"
#include "analysis/yunet_sface_analyzer.hpp"
#include "config/ranking_config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "service/album_service.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout <<
        "Uso: photorank [--config config.toml] <comando> [args]\n"
        "\n"
        "  albums                              lista los albums\n"
        "  sync <album> [--async]              sincroniza cache + clusters\n"
        "  status <album>                      estado del ultimo sync\n"
        "  people <album>                      personas unicas del album\n"
        "  rank <album> <ref> [--top N] [--live]\n"
        "  name <ref> <nombre>                 nombra / renombra una persona\n"
        "  forget <global_id>                  elimina una persona global\n"
        "  find <imagen> [--threshold T] [--top N]\n"
        "  resolve <ref>                       albums y fotos de una persona\n"
        "  faces <album> <archivo>             rostros de una foto\n"
        "\n"
        "  ref = <global_id> | <album>:<cluster_index>\n";
}

// Extractor real (YuNet + SFace + FER+). Emociones opcionales
std::shared_ptr<QualityExtractor> make_extractor(const RankingConfig& cfg) {
    auto analyzer = std::make_shared<YuNetSFaceAnalyzer>(cfg.models);

    std::shared_ptr<EmotionScorer> emotion;
    if (cfg.models.emotion_enabled) {
        try {
            emotion = std::make_shared<FerPlusEmotionScorer>(cfg.models.emotion_path);
        } catch (const photorank::ModelUnavailableError& e) {
            spdlog::warn("⚠️  Emociones deshabilitadas: {}", e.what());
        }
    }

    return std::make_shared<QualityExtractor>(analyzer, emotion, cfg.extractor);
}

bool needs_models(const std::string& command, const std::vector<std::string>& args) {
    if (command == "sync" || command == "find") return true;
    if (command == "rank") {
        for (const auto& a : args) {
            if (a == "--live") return true;
        }
    }
    return false;
}

std::string option(const std::vector<std::string>& args, const std::string& name, const std::string& def) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) return args[i + 1];
    }
    return def;
}

bool flag(const std::vector<std::string>& args, const std::string& name) {
    for (const auto& a : args) {
        if (a == name) return true;
    }
    return false;
}

void print_status(const AlbumStatus& s) {
    std::cout << s.album_id << ": " << to_string(s.status);
    if (!s.message.empty()) std::cout << " (" << s.message << ")";
    std::cout << "\n  imagenes: " << s.image_count << "  personas: " << s.people_count << "\n";

    if (s.last_report) {
        std::cout << "  actualizadas: " << s.last_report->updated.size()
                  << "  eliminadas: " << s.last_report->removed.size()
                  << "  fallidas: " << s.last_report->failed.size() << "\n";
    }
}

void print_candidate(const MatchCandidate& c) {
    std::cout << "  " << std::left << std::setw(24) << c.ref
              << std::setw(24) << c.name
              << std::fixed << std::setprecision(3) << c.similarity << "\n";
}

int run_command(AlbumService& service, const RankingConfig& cfg,
                const std::string& command, const std::vector<std::string>& args) {
    auto arg = [&](size_t i) -> const std::string& {
        if (i >= args.size()) {
            throw std::invalid_argument("Faltan argumentos para '" + command + "'");
        }
        return args[i];
    };

    if (command == "albums") {
        for (const auto& id : service.list_albums()) {
            std::cout << id << "\n";
        }
        return 0;
    }

    if (command == "sync") {
        const std::string& album = arg(0);
        if (flag(args, "--async")) {
            if (!service.trigger_sync(album)) {
                std::cout << "Sync de " << album << " ya en curso\n";
                return 2;
            }
            service.wait_idle();
            print_status(service.status(album));
        } else {
            print_status(service.run_sync(album));
        }
        return service.status(album).status == SyncStatus::Done ? 0 : 1;
    }

    if (command == "status") {
        print_status(service.status(arg(0)));
        return 0;
    }

    if (command == "people") {
        for (const auto& p : service.list_people(arg(0))) {
            std::cout << std::left << std::setw(20) << p.ref
                      << std::setw(24) << p.name
                      << "rostros=" << p.face_count
                      << " fotos=" << p.photo_count
                      << (p.global_id.empty() ? "" : "  global=" + p.global_id) << "\n";
        }
        return 0;
    }

    if (command == "rank") {
        int top_k = std::stoi(option(args, "--top", std::to_string(cfg.scoring.default_top_k)));
        auto photos = service.ranked_photos(arg(0), arg(1), top_k, !flag(args, "--live"));

        int pos = 1;
        for (const auto& p : photos) {
            std::cout << std::right << std::setw(4) << pos++ << ". "
                      << std::left << std::setw(32) << p.filename
                      << std::fixed << std::setprecision(4) << p.score
                      << (p.group ? "  [grupo]" : "") << "\n";
        }
        return 0;
    }

    if (command == "name") {
        std::string name;
        for (size_t i = 1; i < args.size(); ++i) {
            name += (i > 1 ? " " : "") + args[i];
        }
        GlobalPerson person = service.rename_person(arg(0), name);
        std::cout << person.id << " -> " << person.name << "\n";
        return 0;
    }

    if (command == "forget") {
        service.remove_person(arg(0));
        std::cout << "Eliminada " << arg(0) << "\n";
        return 0;
    }

    if (command == "find") {
        cv::Mat image = cv::imread(arg(0), cv::IMREAD_COLOR);
        if (image.empty()) {
            spdlog::error("No se pudo leer {}", arg(0));
            return 1;
        }

        float threshold = std::stof(option(args, "--threshold", std::to_string(cfg.matching.find_threshold)));
        int top_k = std::stoi(option(args, "--top", std::to_string(cfg.matching.top_k)));

        MatchResult result = service.find_person(image, threshold, top_k);
        if (result.matched) {
            std::cout << "MATCH\n";
            print_candidate(*result.match);
        } else {
            std::cout << "SIN MATCH (mejor " << std::fixed << std::setprecision(3)
                      << result.best_similarity << "), candidatos:\n";
            for (const auto& c : result.candidates) print_candidate(c);
        }
        return 0;
    }

    if (command == "resolve") {
        PersonResolution res = service.resolve(arg(0));
        std::cout << res.name;
        if (!res.global_id.empty()) std::cout << " (" << res.global_id << ")";
        std::cout << "\n";

        for (const auto& a : res.appearances) {
            std::cout << "  " << a.album_id << ":" << a.cluster_index
                      << "  " << a.photos.size() << " fotos\n";
            for (const auto& photo : a.photos) {
                std::cout << "    " << photo << "\n";
            }
        }
        return 0;
    }

    if (command == "faces") {
        for (const auto& f : service.faces_in_photo(arg(0), arg(1))) {
            std::cout << "  #" << f.face_index
                      << " [" << static_cast<int>(f.bbox.x1) << "," << static_cast<int>(f.bbox.y1)
                      << " " << static_cast<int>(f.bbox.width()) << "x" << static_cast<int>(f.bbox.height()) << "] "
                      << (f.cluster_index ? f.ref + "  " + f.name : "-") << "\n";
        }
        return 0;
    }

    print_usage();
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern(Config::LOG_PATTERN);

    std::string config_file = "configs/config.toml";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string command = args.front();
    args.erase(args.begin());

    try {
        RankingConfig cfg = RankingConfig::load(config_file);
        photorank::setup_logging(cfg.logging);

        std::shared_ptr<QualityExtractor> extractor;
        if (needs_models(command, args)) {
            extractor = make_extractor(cfg);
        }

        AlbumService service(cfg, extractor);
        return run_command(service, cfg, command, args);

    } catch (const photorank::NoFaceFoundError& e) {
        spdlog::error("No se encontro ningun rostro: {}", e.what());
        return 3;
    } catch (const photorank::PersonNotFoundError& e) {
        spdlog::error("Persona no encontrada: {}", e.what());
        return 4;
    } catch (const photorank::AlbumNotFoundError& e) {
        spdlog::error("Album no encontrado: {}", e.what());
        return 4;
    } catch (const photorank::ModelUnavailableError& e) {
        spdlog::error("Modelo no disponible: {}", e.what());
        return 5;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
