// ============= include/matching/person_registry.hpp =============
/*
 * PersonRegistry - personas globales compartidas entre albums
 *
 * ARCHIVO: <data_dir>/people.db (SqliteDocument, formato photorank-registry)
 * CROPS:   <data_dir>/faces/<id>.jpg
 *
 * CONCURRENCIA:
 * - Lecturas: snapshot() inmutable, sin locks (atomic shared_ptr)
 * - Escrituras: serializadas por write_mutex
 *     copia -> modificar -> persistir (tmp + rename) -> publicar
 *   Si persistir falla, el snapshot publicado no cambia y se lanza PipelineError.
 */

#pragma once
#include "config/ranking_config.hpp"
#include "face_types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class PersonRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<GlobalPerson>>;

private:
    std::string registry_path;
    std::string crop_dir;

    Snapshot people;          // acceso solo via std::atomic_load/store
    std::mutex write_mutex;
    int64_t next_seq = 1;

    bool persist(const std::vector<GlobalPerson>& list, int64_t seq) const;
    void publish(std::vector<GlobalPerson> list);

public:
    explicit PersonRegistry(const StorageConfig& config);

    // Archivo ausente -> vacio (true). Corrupto -> warning, vacio (false)
    bool load();

    Snapshot snapshot() const;

    // Crea una persona; source_crop (opcional) se copia a faces/<id>.jpg
    GlobalPerson add(const std::string& name,
                     const std::vector<float>& embedding,
                     const std::string& source_crop = "");

    // Lanzan photorank::PersonNotFoundError si el id no existe
    GlobalPerson rename(const std::string& id, const std::string& name);
    void remove(const std::string& id);

    std::optional<GlobalPerson> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    size_t size() const;

    const std::string& path() const { return registry_path; }

    static std::string generate_id(int length = 16);
    static std::string normalize_name(const std::string& name);
};
