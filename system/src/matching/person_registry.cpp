// ============= src/matching/person_registry.cpp =============
#include "matching/person_registry.hpp"
#include "database/sqlite_document.hpp"
#include "core/errors.hpp"
#include "core/similarity.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* REGISTRY_SCHEMA = R"(
    CREATE TABLE people (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        embedding BLOB NOT NULL,
        crop_ref TEXT NOT NULL DEFAULT '',
        created_seq INTEGER NOT NULL,
        created_at INTEGER NOT NULL
    );
)";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

PersonRegistry::PersonRegistry(const StorageConfig& config)
    : registry_path((fs::path(config.data_dir) / config.registry_filename).string()),
      crop_dir((fs::path(config.data_dir) / config.global_crop_dir).string()),
      people(std::make_shared<const std::vector<GlobalPerson>>())
{
}

// ==================== SNAPSHOTS ====================

PersonRegistry::Snapshot PersonRegistry::snapshot() const {
    return std::atomic_load(&people);
}

void PersonRegistry::publish(std::vector<GlobalPerson> list) {
    std::atomic_store(&people, Snapshot(std::make_shared<const std::vector<GlobalPerson>>(std::move(list))));
}

std::optional<GlobalPerson> PersonRegistry::get(const std::string& id) const {
    auto snap = snapshot();
    for (const auto& p : *snap) {
        if (p.id == id) return p;
    }
    return std::nullopt;
}

bool PersonRegistry::contains(const std::string& id) const {
    return get(id).has_value();
}

size_t PersonRegistry::size() const {
    return snapshot()->size();
}

// ==================== PERSISTENCE ====================

bool PersonRegistry::load() {
    std::lock_guard<std::mutex> lock(write_mutex);

    if (!fs::exists(registry_path)) {
        publish({});
        next_seq = 1;
        return true;
    }

    std::vector<GlobalPerson> loaded;
    int64_t seq = 1;
    bool ok = false;

    {
        SqliteDocument doc;
        if (doc.open_readonly(registry_path) &&
            doc.check_header(Config::REGISTRY_FORMAT, Config::REGISTRY_FORMAT_VERSION)) {

            sqlite3_stmt* stmt = nullptr;
            const char* sql = "SELECT id, name, embedding, crop_ref, created_seq, created_at "
                              "FROM people ORDER BY created_seq";

            if (sqlite3_prepare_v2(doc.handle(), sql, -1, &stmt, nullptr) == SQLITE_OK) {
                int rc;
                ok = true;
                while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
                    GlobalPerson p;
                    p.id = column_text(stmt, 0);
                    p.name = column_text(stmt, 1);

                    const void* blob = sqlite3_column_blob(stmt, 2);
                    int blob_size = sqlite3_column_bytes(stmt, 2);
                    p.representative_embedding = SqliteDocument::deserialize_embedding(blob, blob_size);

                    p.crop_ref = column_text(stmt, 3);
                    p.created_seq = sqlite3_column_int64(stmt, 4);
                    p.created_at = sqlite3_column_int64(stmt, 5);

                    if (p.id.empty() || p.representative_embedding.empty()) {
                        ok = false;
                        break;
                    }
                    seq = std::max(seq, p.created_seq + 1);
                    loaded.push_back(std::move(p));
                }
                sqlite3_finalize(stmt);
                ok = ok && rc == SQLITE_DONE;
            }

            std::string stored_seq = doc.meta("next_seq");
            if (ok && !stored_seq.empty()) {
                try {
                    seq = std::max<int64_t>(seq, std::stoll(stored_seq));
                } catch (const std::exception&) {
                    spdlog::warn("next_seq invalido en {}: '{}'", registry_path, stored_seq);
                }
            }
        }
    }

    if (!ok) {
        spdlog::warn("⚠️  Registry corrupto o incompatible: {} (se inicia vacio)", registry_path);
        publish({});
        next_seq = 1;
        return false;
    }

    next_seq = seq;
    spdlog::info("📇 Registry cargado: {} personas", loaded.size());
    publish(std::move(loaded));
    return true;
}

bool PersonRegistry::persist(const std::vector<GlobalPerson>& list, int64_t seq) const {
    std::error_code ec;
    fs::create_directories(fs::path(registry_path).parent_path(), ec);

    const std::string tmp = registry_path + ".tmp";
    bool ok;
    {
        SqliteDocument doc;
        int dim = list.empty() ? 0 : static_cast<int>(list.front().representative_embedding.size());
        ok = doc.create(tmp) &&
             doc.begin() &&
             doc.write_header(Config::REGISTRY_FORMAT, Config::REGISTRY_FORMAT_VERSION, dim) &&
             doc.set_meta("next_seq", std::to_string(seq)) &&
             doc.exec(REGISTRY_SCHEMA);

        sqlite3_stmt* stmt = nullptr;
        if (ok && sqlite3_prepare_v2(doc.handle(),
                "INSERT INTO people (id, name, embedding, crop_ref, created_seq, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?)", -1, &stmt, nullptr) != SQLITE_OK) {
            spdlog::error("Prepare failed: {}", sqlite3_errmsg(doc.handle()));
            ok = false;
        }

        for (size_t i = 0; ok && i < list.size(); ++i) {
            const auto& p = list[i];
            auto blob = SqliteDocument::serialize_embedding(p.representative_embedding);

            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, p.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, p.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_blob(stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, p.crop_ref.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 5, p.created_seq);
            sqlite3_bind_int64(stmt, 6, p.created_at);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                spdlog::error("Insert person {} failed: {}", p.id, sqlite3_errmsg(doc.handle()));
                ok = false;
            }
        }
        sqlite3_finalize(stmt);

        ok = ok && doc.commit();
    }

    if (!ok) {
        fs::remove(tmp, ec);
        return false;
    }
    return SqliteDocument::promote(tmp, registry_path);
}

// ==================== WRITES ====================

GlobalPerson PersonRegistry::add(const std::string& name,
                                 const std::vector<float>& embedding,
                                 const std::string& source_crop) {
    std::vector<float> emb = embedding;
    if (emb.empty() || !photorank::l2_normalize(emb)) {
        throw std::invalid_argument("GlobalPerson requires a non-zero embedding");
    }

    std::lock_guard<std::mutex> lock(write_mutex);
    auto current = snapshot();

    GlobalPerson person;
    do {
        person.id = generate_id();
    } while (std::any_of(current->begin(), current->end(),
                         [&](const GlobalPerson& p) { return p.id == person.id; }));

    person.name = normalize_name(name);
    person.representative_embedding = std::move(emb);
    person.created_seq = next_seq;
    person.created_at = now_seconds();

    std::error_code ec;
    if (!source_crop.empty() && fs::exists(source_crop)) {
        fs::create_directories(crop_dir, ec);
        std::string dst = (fs::path(crop_dir) / (person.id + ".jpg")).string();
        fs::copy_file(source_crop, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("No se pudo copiar crop {} -> {}: {}", source_crop, dst, ec.message());
        } else {
            person.crop_ref = dst;
        }
    }

    std::vector<GlobalPerson> next(*current);
    next.push_back(person);

    if (!persist(next, next_seq + 1)) {
        if (!person.crop_ref.empty()) fs::remove(person.crop_ref, ec);
        throw photorank::PipelineError("Cannot persist registry " + registry_path);
    }

    ++next_seq;
    publish(std::move(next));

    spdlog::info("✓ Persona global creada: {} ({})", person.name, person.id);
    return person;
}

GlobalPerson PersonRegistry::rename(const std::string& id, const std::string& name) {
    std::lock_guard<std::mutex> lock(write_mutex);
    auto current = snapshot();

    std::vector<GlobalPerson> next(*current);
    auto it = std::find_if(next.begin(), next.end(), [&](const GlobalPerson& p) { return p.id == id; });
    if (it == next.end()) {
        throw photorank::PersonNotFoundError("Unknown person: " + id);
    }

    it->name = normalize_name(name);
    GlobalPerson updated = *it;

    if (!persist(next, next_seq)) {
        throw photorank::PipelineError("Cannot persist registry " + registry_path);
    }
    publish(std::move(next));

    spdlog::info("✏️  Persona {} renombrada a '{}'", id, updated.name);
    return updated;
}

void PersonRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(write_mutex);
    auto current = snapshot();

    std::vector<GlobalPerson> next(*current);
    auto it = std::find_if(next.begin(), next.end(), [&](const GlobalPerson& p) { return p.id == id; });
    if (it == next.end()) {
        throw photorank::PersonNotFoundError("Unknown person: " + id);
    }

    std::string crop = it->crop_ref;
    next.erase(it);

    if (!persist(next, next_seq)) {
        throw photorank::PipelineError("Cannot persist registry " + registry_path);
    }
    publish(std::move(next));

    if (!crop.empty()) {
        std::error_code ec;
        fs::remove(crop, ec);
    }

    spdlog::info("🗑️  Persona {} eliminada", id);
}

// ==================== HELPERS ====================

std::string PersonRegistry::generate_id(int length) {
    static const char charset[] = "abcdefghijklmnopqrstuvwxyz0123456789";

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, static_cast<int>(sizeof(charset)) - 2);

    std::string id;
    id.reserve(length);
    for (int i = 0; i < length; ++i) {
        id += charset[dis(gen)];
    }
    return id;
}

std::string PersonRegistry::normalize_name(const std::string& name) {
    auto start = name.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "Unnamed";
    auto end = name.find_last_not_of(" \t\r\n");
    return name.substr(start, end - start + 1);
}
