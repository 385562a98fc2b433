// ============= include/database/metadata_store.hpp =============
/*
 * MetadataStore - cache incremental por album
 *
 * ARCHIVO: <album>/.photorank_cache.db (SqliteDocument, formato photorank-album-cache)
 *
 * TABLAS:
 *   images(filename PK, fingerprint, blur, failed, error)
 *   faces(filename, face_index, bbox, embedding BLOB, facing, confidence, size_px, smile)
 *
 * SYNC:
 * - fingerprint = "<size>:<mtime-ns>"
 * - mismo fingerprint -> se reusa la entrada (sin extraccion)
 * - distinto / nuevo  -> extraccion y reemplazo completo de la entrada
 * - archivo borrado   -> entrada eliminada
 * - extraccion fallida -> failed=true, fingerprint vacio (se reintenta)
 *
 * Es la unica fuente de verdad para clustering, matching y ranking.
 */

#pragma once
#include "analysis/quality_extractor.hpp"
#include "face_types.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

struct SyncReport {
    std::set<std::string> updated;
    std::set<std::string> removed;
    std::set<std::string> failed;   // subconjunto de updated

    bool changed() const { return !updated.empty() || !removed.empty(); }
};

// (procesadas, total, filename)
using SyncProgress = std::function<void(size_t, size_t, const std::string&)>;

class MetadataStore {
private:
    std::string album_dir;
    std::string cache_file;
    AlbumMetadata entries;

public:
    MetadataStore(const std::string& album_dir, const std::string& cache_filename);

    // Archivo ausente -> vacio (true). Corrupto / version incompatible -> warning, vacio (false)
    bool load();

    // Escribe <cache>.tmp y lo promueve. Lanza PipelineError si falla
    void save() const;

    // Guarda solo si hubo cambios o si el cache aun no existe en disco
    bool save_if_changed(const SyncReport& report) const;

    // Lanza PipelineError si el directorio no se puede leer,
    // ModelUnavailableError si el proveedor no puede ejecutarse
    SyncReport sync(const QualityExtractor& extractor, const SyncProgress& progress = nullptr);

    const AlbumMetadata& get_entries() const { return entries; }
    const std::string& get_album_dir() const { return album_dir; }
    std::string cache_path() const { return cache_file; }

    static std::string fingerprint(const std::string& path);
    static bool is_image_file(const std::string& filename);
    static std::vector<std::string> list_images(const std::string& album_dir);

    // Lee un cache sin instanciar el store (para lectores y herramientas)
    static bool read_cache(const std::string& cache_path, AlbumMetadata& out);
};
