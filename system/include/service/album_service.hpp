// ============= include/service/album_service.hpp =============
/*
 * AlbumService - operaciones expuestas al host (CLI / API)
 *
 * ALBUMS: subdirectorios de storage.albums_dir (album_id = nombre del directorio)
 *
 * PIPELINE (uno por album a la vez, en el ThreadPool):
 *   load cache -> sync -> save -> cluster -> link -> crops -> publicar vista
 *   Un segundo trigger mientras hay uno pendiente/en curso se rechaza.
 *   Si falla: status=error con mensaje; la vista y el cache anteriores se mantienen.
 *
 * LECTORES: trabajan sobre la ultima AlbumView publicada (shared_ptr inmutable,
 * atomic_load/store); nunca esperan al pipeline.
 */

#pragma once
#include "analysis/quality_extractor.hpp"
#include "clustering/identity_clusterer.hpp"
#include "config/ranking_config.hpp"
#include "database/metadata_store.hpp"
#include "face_types.hpp"
#include "matching/identity_matcher.hpp"
#include "matching/person_registry.hpp"
#include "ranking/ranker.hpp"
#include "service/thread_pool.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class SyncStatus {
    Pending,
    Processing,
    Done,
    Error
};

std::string to_string(SyncStatus status);

struct AlbumStatus {
    std::string album_id;
    SyncStatus status = SyncStatus::Pending;
    std::string message;
    std::optional<SyncReport> last_report;
    size_t image_count = 0;
    size_t people_count = 0;
};

struct PersonSummary {
    std::string ref;
    int cluster_index = 0;
    std::string name;
    std::string global_id;     // vacio si no esta enlazado
    size_t face_count = 0;
    size_t photo_count = 0;
    std::string crop_path;
};

struct AlbumAppearance {
    std::string album_id;
    int cluster_index = 0;
    std::vector<std::string> photos;
};

struct PersonResolution {
    std::string ref;
    std::string name;
    std::string global_id;
    std::vector<AlbumAppearance> appearances;
};

struct PhotoFace {
    int face_index = 0;
    BoundingBox bbox;
    std::optional<int> cluster_index;
    std::string ref;
    std::string name;
};

class AlbumService {
private:
    struct AlbumState {
        std::mutex pipeline_mutex;   // pipeline y cambios de links en la vista
        std::mutex status_mutex;
        std::mutex load_mutex;       // carga perezosa / publicacion de la vista

        SyncStatus status = SyncStatus::Pending;
        std::string message;
        std::optional<SyncReport> report;
        bool in_flight = false;

        bool loaded = false;
        std::shared_ptr<const AlbumView> view;   // atomic_load/store
    };

    RankingConfig config;
    std::shared_ptr<QualityExtractor> extractor;   // null -> solo lectura
    PersonRegistry registry;
    IdentityMatcher matcher;
    IdentityClusterer clusterer;
    Ranker ranker;

    mutable std::mutex albums_mutex;
    mutable std::map<std::string, std::shared_ptr<AlbumState>> albums;

    ThreadPool pool;   // ultimo: se destruye primero

    std::string album_dir(const std::string& album_id) const;
    void require_album(const std::string& album_id) const;
    std::shared_ptr<AlbumState> state_for(const std::string& album_id) const;

    std::shared_ptr<const AlbumView> view_for(const std::string& album_id) const;
    std::shared_ptr<const AlbumView> build_view(const std::string& album_id,
                                                std::shared_ptr<const AlbumMetadata> metadata,
                                                bool write_crops) const;
    void publish(AlbumState& state, std::shared_ptr<const AlbumView> view) const;
    std::vector<AlbumView> committed_views() const;

    void run_pipeline(const std::string& album_id, AlbumState& state);
    const QualityExtractor& require_extractor() const;

    const PersonCluster& find_cluster(const AlbumView& view, int cluster_index) const;
    std::optional<GlobalPerson> linked_person(const PersonCluster& cluster,
                                              const PersonRegistry::Snapshot& people) const;

    // Objetivo del ranking: cluster sin enlazar (por su representante) o persona global
    struct RankTarget {
        std::optional<FaceRef> representative;
        std::string global_id;
    };
    static std::set<FaceRef> select_targets(const std::vector<PersonCluster>& clusters,
                                            const RankTarget& target);
    std::vector<PersonCluster> live_clusters(const AlbumMetadata& live,
                                             const AlbumView* committed) const;

public:
    AlbumService(const RankingConfig& config, std::shared_ptr<QualityExtractor> extractor);
    ~AlbumService();

    // ===== PIPELINE =====

    // true si se encolo; false si ya hay uno pendiente o en curso para ese album
    bool trigger_sync(const std::string& album_id);

    // Pipeline sincrono. Lanza PipelineError si ya hay uno en curso
    AlbumStatus run_sync(const std::string& album_id);

    AlbumStatus status(const std::string& album_id) const;
    void wait_idle();

    // ===== LECTURA =====

    std::vector<std::string> list_albums() const;
    std::vector<PersonSummary> list_people(const std::string& album_id) const;

    std::vector<RankedPhoto> ranked_photos(const std::string& album_id,
                                           const std::string& person_ref,
                                           int top_k,
                                           bool use_cache = true) const;

    // Lanza NoFaceFoundError si la imagen no tiene rostros validos
    MatchResult find_person(const cv::Mat& query_image, float threshold, int top_k) const;

    PersonResolution resolve(const std::string& person_ref) const;

    std::vector<PhotoFace> faces_in_photo(const std::string& album_id, const std::string& filename) const;

    // ===== ESCRITURA (registry) =====

    GlobalPerson rename_person(const std::string& person_ref, const std::string& name);
    void remove_person(const std::string& global_id);

    const RankingConfig& get_config() const { return config; }
    const PersonRegistry& get_registry() const { return registry; }
};
