// ============= src/database/sqlite_document.cpp =============
#include "database/sqlite_document.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

SqliteDocument::~SqliteDocument() {
    close();
}

void SqliteDocument::close() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

bool SqliteDocument::open_readonly(const std::string& filename) {
    close();
    path = filename;

    int rc = sqlite3_open_v2(filename.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot open {}: {}", filename, db ? sqlite3_errmsg(db) : "out of memory");
        close();
        return false;
    }
    return true;
}

bool SqliteDocument::create(const std::string& filename) {
    close();
    path = filename;

    std::error_code ec;
    fs::remove(filename, ec);
    fs::remove(filename + "-journal", ec);

    int rc = sqlite3_open_v2(filename.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("Cannot create {}: {}", filename, db ? sqlite3_errmsg(db) : "out of memory");
        close();
        return false;
    }
    return true;
}

bool SqliteDocument::exec(const std::string& sql) {
    if (!db) return false;

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);

    if (rc != SQLITE_OK) {
        spdlog::error("SQL error ({}): {}", path, err ? err : sqlite3_errmsg(db));
        sqlite3_free(err);
        return false;
    }
    return true;
}

// ==================== HEADER ====================

int SqliteDocument::user_version() {
    if (!db) return -1;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }

    int version = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

bool SqliteDocument::set_user_version(int version) {
    return exec("PRAGMA user_version = " + std::to_string(version) + ";");
}

std::string SqliteDocument::meta(const std::string& key) {
    if (!db) return "";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT value FROM meta WHERE key=?", -1, &stmt, nullptr) != SQLITE_OK) {
        return "";
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::string value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) value = reinterpret_cast<const char*>(text);
    }
    sqlite3_finalize(stmt);
    return value;
}

bool SqliteDocument::set_meta(const std::string& key, const std::string& value) {
    if (!db) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("Prepare failed ({}): {}", path, sqlite3_errmsg(db));
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool SqliteDocument::write_header(const std::string& format, int version, int embedding_dim) {
    if (!exec("CREATE TABLE meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);")) return false;

    return set_user_version(version) &&
           set_meta("format", format) &&
           set_meta("version", std::to_string(version)) &&
           set_meta("embedding_dim", std::to_string(embedding_dim));
}

bool SqliteDocument::check_header(const std::string& format, int version) {
    int uv = user_version();
    if (uv != version) {
        spdlog::warn("{}: user_version {} (esperado {})", path, uv, version);
        return false;
    }

    std::string fmt = meta("format");
    if (fmt != format) {
        spdlog::warn("{}: formato '{}' (esperado '{}')", path, fmt, format);
        return false;
    }

    if (meta("version") != std::to_string(version)) {
        spdlog::warn("{}: version en meta no coincide", path);
        return false;
    }
    return true;
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteDocument::serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

std::vector<float> SqliteDocument::deserialize_embedding(const void* data, int size) {
    if (!data || size <= 0) return {};

    std::vector<float> emb(static_cast<size_t>(size) / sizeof(float));
    std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    return emb;
}

// ==================== PROMOTE ====================

bool SqliteDocument::promote(const std::string& tmp_path, const std::string& live_path) {
    std::error_code ec;
    fs::rename(tmp_path, live_path, ec);
    if (ec) {
        spdlog::error("Cannot promote {} -> {}: {}", tmp_path, live_path, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}
