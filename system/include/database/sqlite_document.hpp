// ============= include/database/sqlite_document.hpp =============
/*
 * SqliteDocument - un archivo SQLite tratado como documento versionado
 *
 * HEADER:
 * - PRAGMA user_version = version
 * - tabla meta(key, value): format, version, embedding_dim, ...
 *
 * ESCRITURA CRASH-SAFE:
 *   create("<live>.tmp") -> escribir todo -> close() -> promote(tmp, live)
 *   promote = rename atomico; un lector nunca ve un archivo a medias.
 */

#pragma once
#include <sqlite3.h>
#include <string>
#include <vector>

class SqliteDocument {
private:
    sqlite3* db = nullptr;
    std::string path;

public:
    SqliteDocument() = default;
    ~SqliteDocument();

    SqliteDocument(const SqliteDocument&) = delete;
    SqliteDocument& operator=(const SqliteDocument&) = delete;

    bool open_readonly(const std::string& filename);
    // Borra cualquier archivo previo y crea uno nuevo
    bool create(const std::string& filename);
    void close();

    bool exec(const std::string& sql);
    bool begin() { return exec("BEGIN;"); }
    bool commit() { return exec("COMMIT;"); }

    int user_version();
    bool set_user_version(int version);

    bool write_header(const std::string& format, int version, int embedding_dim);
    bool check_header(const std::string& format, int version);
    std::string meta(const std::string& key);
    bool set_meta(const std::string& key, const std::string& value);

    sqlite3* handle() { return db; }
    const std::string& filename() const { return path; }

    static std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
    static std::vector<float> deserialize_embedding(const void* data, int size);

    static bool promote(const std::string& tmp_path, const std::string& live_path);
};
