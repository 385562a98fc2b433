// ============= src/database/metadata_store.cpp =============
#include "database/metadata_store.hpp"
#include "database/sqlite_document.hpp"
#include "core/errors.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* CACHE_SCHEMA = R"(
    CREATE TABLE images (
        filename TEXT PRIMARY KEY,
        fingerprint TEXT NOT NULL,
        blur REAL NOT NULL,
        failed INTEGER NOT NULL DEFAULT 0,
        error TEXT NOT NULL DEFAULT ''
    );

    CREATE TABLE faces (
        filename TEXT NOT NULL,
        face_index INTEGER NOT NULL,
        x1 REAL, y1 REAL, x2 REAL, y2 REAL,
        embedding BLOB NOT NULL,
        facing REAL NOT NULL,
        confidence REAL NOT NULL,
        size_px REAL NOT NULL,
        smile REAL NOT NULL,
        PRIMARY KEY (filename, face_index)
    );
)";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

bool write_images(SqliteDocument& doc, const AlbumMetadata& entries) {
    sqlite3* db = doc.handle();
    sqlite3_stmt* img_stmt = nullptr;
    sqlite3_stmt* face_stmt = nullptr;

    const char* img_sql = "INSERT INTO images (filename, fingerprint, blur, failed, error) "
                          "VALUES (?, ?, ?, ?, ?)";
    const char* face_sql = "INSERT INTO faces (filename, face_index, x1, y1, x2, y2, embedding, "
                           "facing, confidence, size_px, smile) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    if (sqlite3_prepare_v2(db, img_sql, -1, &img_stmt, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db, face_sql, -1, &face_stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Prepare failed: {}", sqlite3_errmsg(db));
        sqlite3_finalize(img_stmt);
        sqlite3_finalize(face_stmt);
        return false;
    }

    bool ok = true;
    for (const auto& [filename, meta] : entries) {
        sqlite3_reset(img_stmt);
        sqlite3_bind_text(img_stmt, 1, filename.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(img_stmt, 2, meta.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(img_stmt, 3, meta.blur_score);
        sqlite3_bind_int(img_stmt, 4, meta.failed ? 1 : 0);
        sqlite3_bind_text(img_stmt, 5, meta.error.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(img_stmt) != SQLITE_DONE) {
            spdlog::error("Insert image {} failed: {}", filename, sqlite3_errmsg(db));
            ok = false;
            break;
        }

        for (const auto& face : meta.faces) {
            auto blob = SqliteDocument::serialize_embedding(face.embedding);

            sqlite3_reset(face_stmt);
            sqlite3_bind_text(face_stmt, 1, filename.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(face_stmt, 2, face.face_index);
            sqlite3_bind_double(face_stmt, 3, face.bbox.x1);
            sqlite3_bind_double(face_stmt, 4, face.bbox.y1);
            sqlite3_bind_double(face_stmt, 5, face.bbox.x2);
            sqlite3_bind_double(face_stmt, 6, face.bbox.y2);
            sqlite3_bind_blob(face_stmt, 7, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            sqlite3_bind_double(face_stmt, 8, face.facing_score);
            sqlite3_bind_double(face_stmt, 9, face.confidence);
            sqlite3_bind_double(face_stmt, 10, face.size_px);
            sqlite3_bind_double(face_stmt, 11, face.smile_score);

            if (sqlite3_step(face_stmt) != SQLITE_DONE) {
                spdlog::error("Insert face {}#{} failed: {}", filename, face.face_index, sqlite3_errmsg(db));
                ok = false;
                break;
            }
        }
        if (!ok) break;
    }

    sqlite3_finalize(img_stmt);
    sqlite3_finalize(face_stmt);
    return ok;
}

bool read_images(SqliteDocument& doc, AlbumMetadata& out) {
    sqlite3* db = doc.handle();
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db, "SELECT filename, fingerprint, blur, failed, error FROM images",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::warn("{}: tabla images ilegible ({})", doc.filename(), sqlite3_errmsg(db));
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ImageMetadata meta;
        meta.filename = column_text(stmt, 0);
        meta.fingerprint = column_text(stmt, 1);
        meta.blur_score = sqlite3_column_double(stmt, 2);
        meta.failed = sqlite3_column_int(stmt, 3) != 0;
        meta.error = column_text(stmt, 4);
        out[meta.filename] = std::move(meta);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return false;

    const char* face_sql = "SELECT filename, face_index, x1, y1, x2, y2, embedding, facing, "
                           "confidence, size_px, smile FROM faces ORDER BY filename, face_index";
    if (sqlite3_prepare_v2(db, face_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::warn("{}: tabla faces ilegible ({})", doc.filename(), sqlite3_errmsg(db));
        return false;
    }

    bool ok = true;
    size_t dim = 0;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::string filename = column_text(stmt, 0);
        auto it = out.find(filename);
        if (it == out.end()) {
            spdlog::warn("{}: rostro huerfano para '{}'", doc.filename(), filename);
            ok = false;
            break;
        }

        FaceRecord face;
        face.face_index = sqlite3_column_int(stmt, 1);
        face.bbox.x1 = static_cast<float>(sqlite3_column_double(stmt, 2));
        face.bbox.y1 = static_cast<float>(sqlite3_column_double(stmt, 3));
        face.bbox.x2 = static_cast<float>(sqlite3_column_double(stmt, 4));
        face.bbox.y2 = static_cast<float>(sqlite3_column_double(stmt, 5));

        const void* blob = sqlite3_column_blob(stmt, 6);
        int blob_size = sqlite3_column_bytes(stmt, 6);
        if (blob_size <= 0 || blob_size % static_cast<int>(sizeof(float)) != 0) {
            spdlog::warn("{}: embedding invalido en {}#{}", doc.filename(), filename, face.face_index);
            ok = false;
            break;
        }
        face.embedding = SqliteDocument::deserialize_embedding(blob, blob_size);
        if (dim == 0) dim = face.embedding.size();
        if (face.embedding.size() != dim) {
            spdlog::warn("{}: dimensiones de embedding mezcladas", doc.filename());
            ok = false;
            break;
        }

        face.facing_score = static_cast<float>(sqlite3_column_double(stmt, 7));
        face.confidence = static_cast<float>(sqlite3_column_double(stmt, 8));
        face.size_px = static_cast<float>(sqlite3_column_double(stmt, 9));
        face.smile_score = static_cast<float>(sqlite3_column_double(stmt, 10));

        it->second.faces.push_back(std::move(face));
    }
    sqlite3_finalize(stmt);

    return ok && rc == SQLITE_DONE;
}

} // namespace

MetadataStore::MetadataStore(const std::string& album_dir, const std::string& cache_filename)
    : album_dir(album_dir),
      cache_file((fs::path(album_dir) / cache_filename).string())
{
}

// ==================== FILESYSTEM ====================

std::string MetadataStore::fingerprint(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return "";

    auto mtime = fs::last_write_time(path, ec);
    if (ec) return "";

    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    return std::to_string(size) + ":" + std::to_string(ns);
}

bool MetadataStore::is_image_file(const std::string& filename) {
    if (filename.empty() || filename[0] == '.') return false;

    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::set<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".webp", ".tif", ".tiff"
    };
    return extensions.count(ext) > 0;
}

std::vector<std::string> MetadataStore::list_images(const std::string& album_dir) {
    std::error_code ec;
    fs::directory_iterator it(album_dir, ec);
    if (ec) {
        throw photorank::PipelineError("Cannot read album directory " + album_dir + ": " + ec.message());
    }

    std::vector<std::string> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        std::string name = it->path().filename().string();
        if (is_image_file(name)) {
            files.push_back(name);
        }
    }
    if (ec) {
        throw photorank::PipelineError("Error listing " + album_dir + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

// ==================== PERSISTENCE ====================

bool MetadataStore::read_cache(const std::string& cache_path, AlbumMetadata& out) {
    out.clear();
    if (!fs::exists(cache_path)) return true;

    SqliteDocument doc;
    if (!doc.open_readonly(cache_path)) return false;
    if (!doc.check_header(Config::CACHE_FORMAT, Config::CACHE_FORMAT_VERSION)) return false;

    if (!read_images(doc, out)) {
        out.clear();
        return false;
    }
    return true;
}

bool MetadataStore::load() {
    entries.clear();

    AlbumMetadata loaded;
    if (!read_cache(cache_file, loaded)) {
        spdlog::warn("⚠️  Cache corrupto o incompatible: {} (se reconstruye en el proximo sync)", cache_file);
        return false;
    }

    entries = std::move(loaded);
    spdlog::debug("Cache {} cargado: {} imagenes", cache_file, entries.size());
    return true;
}

void MetadataStore::save() const {
    const std::string tmp = cache_file + ".tmp";

    int dim = 0;
    for (const auto& [name, meta] : entries) {
        if (!meta.faces.empty()) {
            dim = static_cast<int>(meta.faces.front().embedding.size());
            break;
        }
    }

    bool ok;
    {
        SqliteDocument doc;
        ok = doc.create(tmp) &&
             doc.begin() &&
             doc.write_header(Config::CACHE_FORMAT, Config::CACHE_FORMAT_VERSION, dim) &&
             doc.exec(CACHE_SCHEMA) &&
             write_images(doc, entries) &&
             doc.commit();
    }

    if (!ok) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw photorank::PipelineError("Cannot write cache " + tmp);
    }

    if (!SqliteDocument::promote(tmp, cache_file)) {
        throw photorank::PipelineError("Cannot promote cache " + cache_file);
    }

    spdlog::info("💾 Cache guardado: {} ({} imagenes)", cache_file, entries.size());
}

bool MetadataStore::save_if_changed(const SyncReport& report) const {
    if (!report.changed() && fs::exists(cache_file)) {
        spdlog::debug("Cache sin cambios, no se reescribe");
        return false;
    }
    save();
    return true;
}

// ==================== SYNC ====================

SyncReport MetadataStore::sync(const QualityExtractor& extractor, const SyncProgress& progress) {
    auto files = list_images(album_dir);
    std::set<std::string> present(files.begin(), files.end());

    SyncReport report;

    for (auto it = entries.begin(); it != entries.end();) {
        if (present.count(it->first) == 0) {
            report.removed.insert(it->first);
            it = entries.erase(it);
        } else {
            ++it;
        }
    }

    size_t processed = 0;
    for (const auto& file : files) {
        ++processed;
        const std::string full = (fs::path(album_dir) / file).string();
        const std::string fp = fingerprint(full);

        auto existing = entries.find(file);

        // Desaparecio entre el listado y el fingerprint
        if (fp.empty()) {
            if (existing != entries.end()) {
                entries.erase(existing);
                report.removed.insert(file);
            }
            continue;
        }

        if (existing != entries.end() && !existing->second.failed && existing->second.fingerprint == fp) {
            if (progress) progress(processed, files.size(), file);
            continue;
        }

        ImageMetadata meta = extractor.extract_file(full);
        meta.filename = file;

        if (meta.failed) {
            spdlog::warn("❌ Extraccion fallida {}: {}", file, meta.error);
            meta.fingerprint.clear();
            report.failed.insert(file);

            // Mismo fallo que el registrado: la entrada no cambia
            if (existing != entries.end() && existing->second.failed &&
                existing->second.error == meta.error) {
                if (progress) progress(processed, files.size(), file);
                continue;
            }
        } else {
            meta.fingerprint = fp;
        }

        entries[file] = std::move(meta);
        report.updated.insert(file);

        if (progress) progress(processed, files.size(), file);
    }

    spdlog::info("🔄 Sync {}: {} actualizadas, {} eliminadas, {} fallidas, {} total",
                 album_dir, report.updated.size(), report.removed.size(),
                 report.failed.size(), entries.size());
    return report;
}
