// ============= src/service/album_service.cpp =============
#include "service/album_service.hpp"
#include "clustering/face_crop_writer.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

std::string to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Pending:    return "pending";
        case SyncStatus::Processing: return "processing";
        case SyncStatus::Done:       return "done";
        case SyncStatus::Error:      return "error";
        default:                     return "unknown";
    }
}

AlbumService::AlbumService(const RankingConfig& config, std::shared_ptr<QualityExtractor> extractor)
    : config(config),
      extractor(std::move(extractor)),
      registry(config.storage),
      matcher(registry, config.matching),
      clusterer(config.clustering.threshold),
      ranker(config.scoring),
      pool(static_cast<size_t>(config.service.worker_threads), "sync")
{
    spdlog::info("📸 Album service");
    spdlog::info("   Albums:   {}", config.storage.albums_dir);
    spdlog::info("   Registry: {}", registry.path());
    spdlog::info("   Workers:  {}", config.service.worker_threads);

    registry.load();

    if (!this->extractor) {
        spdlog::warn("Sin extractor: sync, find y ranking en vivo deshabilitados");
    }
}

AlbumService::~AlbumService() {
    pool.stop();
}

// ==================== ALBUMS ====================

std::string AlbumService::album_dir(const std::string& album_id) const {
    return (fs::path(config.storage.albums_dir) / album_id).string();
}

void AlbumService::require_album(const std::string& album_id) const {
    if (album_id.empty() || album_id[0] == '.' ||
        album_id.find('/') != std::string::npos || album_id.find('\\') != std::string::npos) {
        throw photorank::AlbumNotFoundError("Invalid album id: '" + album_id + "'");
    }

    std::error_code ec;
    if (!fs::is_directory(album_dir(album_id), ec)) {
        throw photorank::AlbumNotFoundError("Album not found: " + album_id);
    }
}

std::shared_ptr<AlbumService::AlbumState> AlbumService::state_for(const std::string& album_id) const {
    std::lock_guard<std::mutex> lock(albums_mutex);

    auto it = albums.find(album_id);
    if (it != albums.end()) return it->second;

    auto state = std::make_shared<AlbumState>();
    std::error_code ec;
    if (fs::exists(fs::path(album_dir(album_id)) / config.storage.cache_filename, ec)) {
        state->status = SyncStatus::Done;
    }
    albums[album_id] = state;
    return state;
}

std::vector<std::string> AlbumService::list_albums() const {
    std::vector<std::string> ids;

    std::error_code ec;
    for (fs::directory_iterator it(config.storage.albums_dir, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        std::string name = it->path().filename().string();
        if (!name.empty() && name[0] != '.' && it->is_directory(type_ec)) {
            ids.push_back(name);
        }
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

// ==================== VISTAS ====================

std::shared_ptr<const AlbumView> AlbumService::build_view(const std::string& album_id,
                                                          std::shared_ptr<const AlbumMetadata> metadata,
                                                          bool write_crops) const {
    auto view = std::make_shared<AlbumView>();
    view->album_id = album_id;
    view->album_dir = album_dir(album_id);
    view->metadata = std::move(metadata);
    view->clusters = clusterer.cluster(*view->metadata);

    matcher.link(view->clusters);

    FaceCropWriter crops(view->album_dir, config.storage.crop_dir, config.extractor.crop_size);
    if (write_crops) {
        crops.write_all(view->album_dir, view->clusters);
    } else {
        crops.assign_paths(view->clusters);
    }

    return view;
}

void AlbumService::publish(AlbumState& state, std::shared_ptr<const AlbumView> view) const {
    std::lock_guard<std::mutex> lock(state.load_mutex);
    std::atomic_store(&state.view, std::move(view));
    state.loaded = true;
}

std::shared_ptr<const AlbumView> AlbumService::view_for(const std::string& album_id) const {
    auto state = state_for(album_id);

    auto view = std::atomic_load(&state->view);
    if (view) return view;

    std::lock_guard<std::mutex> lock(state->load_mutex);
    if (state->loaded) return std::atomic_load(&state->view);

    // Primera lectura: vista desde el ultimo cache confirmado
    std::string cache = (fs::path(album_dir(album_id)) / config.storage.cache_filename).string();
    auto metadata = std::make_shared<AlbumMetadata>();
    if (!fs::exists(cache) || !MetadataStore::read_cache(cache, *metadata)) {
        state->loaded = true;
        return nullptr;
    }

    view = build_view(album_id, std::move(metadata), false);
    std::atomic_store(&state->view, view);
    state->loaded = true;
    return view;
}

std::vector<AlbumView> AlbumService::committed_views() const {
    std::vector<AlbumView> views;
    for (const auto& id : list_albums()) {
        if (auto view = view_for(id)) {
            views.push_back(*view);
        }
    }
    return views;
}

// ==================== PIPELINE ====================

const QualityExtractor& AlbumService::require_extractor() const {
    if (!extractor) {
        throw photorank::ModelUnavailableError("No face analyzer configured");
    }
    return *extractor;
}

void AlbumService::run_pipeline(const std::string& album_id, AlbumState& state) {
    {
        std::lock_guard<std::mutex> lock(state.status_mutex);
        state.status = SyncStatus::Processing;
        state.message.clear();
    }

    auto t0 = std::chrono::steady_clock::now();
    spdlog::info("▶️  Pipeline {} iniciado", album_id);

    try {
        std::lock_guard<std::mutex> pipeline_lock(state.pipeline_mutex);

        const QualityExtractor& ex = require_extractor();

        MetadataStore store(album_dir(album_id), config.storage.cache_filename);
        store.load();

        SyncReport report = store.sync(ex, [&](size_t done, size_t total, const std::string& file) {
            spdlog::debug("   [{}/{}] {}", done, total, file);
        });
        store.save_if_changed(report);

        auto metadata = std::make_shared<const AlbumMetadata>(store.get_entries());
        auto view = build_view(album_id, metadata, true);
        size_t people = view->clusters.size();
        publish(state, std::move(view));

        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        spdlog::info("✓ Pipeline {} terminado: {} personas ({:.2f}s)", album_id, people, secs);

        std::lock_guard<std::mutex> lock(state.status_mutex);
        state.status = SyncStatus::Done;
        state.report = std::move(report);
        state.in_flight = false;
    } catch (const std::exception& e) {
        spdlog::error("❌ Pipeline {} fallo: {}", album_id, e.what());

        std::lock_guard<std::mutex> lock(state.status_mutex);
        state.status = SyncStatus::Error;
        state.message = e.what();
        state.in_flight = false;
    }
}

bool AlbumService::trigger_sync(const std::string& album_id) {
    require_album(album_id);
    auto state = state_for(album_id);

    {
        std::lock_guard<std::mutex> lock(state->status_mutex);
        if (state->in_flight) {
            spdlog::warn("Sync de {} ya en curso ({}), rechazado", album_id, to_string(state->status));
            return false;
        }
        state->in_flight = true;
        state->status = SyncStatus::Pending;
        state->message.clear();
    }

    try {
        pool.submit([this, album_id, state]() { run_pipeline(album_id, *state); });
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(state->status_mutex);
        state->in_flight = false;
        state->status = SyncStatus::Error;
        state->message = e.what();
        throw;
    }
    return true;
}

AlbumStatus AlbumService::run_sync(const std::string& album_id) {
    require_album(album_id);
    auto state = state_for(album_id);

    {
        std::lock_guard<std::mutex> lock(state->status_mutex);
        if (state->in_flight) {
            throw photorank::PipelineError("Sync already running for album " + album_id);
        }
        state->in_flight = true;
    }

    run_pipeline(album_id, *state);
    return status(album_id);
}

AlbumStatus AlbumService::status(const std::string& album_id) const {
    require_album(album_id);
    auto state = state_for(album_id);

    AlbumStatus s;
    s.album_id = album_id;
    {
        std::lock_guard<std::mutex> lock(state->status_mutex);
        s.status = state->status;
        s.message = state->message;
        s.last_report = state->report;
    }

    if (auto view = std::atomic_load(&state->view)) {
        s.image_count = view->metadata->size();
        s.people_count = view->clusters.size();
    }
    return s;
}

void AlbumService::wait_idle() {
    pool.wait_idle();
}

// ==================== LECTURA ====================

const PersonCluster& AlbumService::find_cluster(const AlbumView& view, int cluster_index) const {
    for (const auto& c : view.clusters) {
        if (c.cluster_index == cluster_index) return c;
    }
    throw photorank::PersonNotFoundError("Unknown person: " + view.album_id + ":" + std::to_string(cluster_index));
}

std::optional<GlobalPerson> AlbumService::linked_person(const PersonCluster& cluster,
                                                        const PersonRegistry::Snapshot& people) const {
    if (!cluster.global_id) return std::nullopt;
    for (const auto& p : *people) {
        if (p.id == *cluster.global_id) return p;
    }
    return std::nullopt;
}

std::vector<PersonSummary> AlbumService::list_people(const std::string& album_id) const {
    require_album(album_id);

    std::vector<PersonSummary> out;
    auto view = view_for(album_id);
    if (!view) return out;

    auto people = registry.snapshot();
    for (const auto& c : view->clusters) {
        PersonSummary s;
        s.ref = PersonRef::cluster(album_id, c.cluster_index).to_string();
        s.cluster_index = c.cluster_index;
        s.face_count = c.members.size();
        s.photo_count = c.photo_count();
        s.crop_path = c.crop_path;

        if (auto person = linked_person(c, people)) {
            s.name = person->name;
            s.global_id = person->id;
        } else {
            s.name = IdentityMatcher::cluster_display_name(album_id, c.cluster_index);
        }
        out.push_back(std::move(s));
    }
    return out;
}

std::set<FaceRef> AlbumService::select_targets(const std::vector<PersonCluster>& clusters,
                                               const RankTarget& target) {
    std::set<FaceRef> out;
    for (const auto& c : clusters) {
        bool selected = target.global_id.empty()
            ? (target.representative && c.members.count(*target.representative) > 0)
            : (c.global_id && *c.global_id == target.global_id);
        if (selected) out.insert(c.members.begin(), c.members.end());
    }
    return out;
}

std::vector<PersonCluster> AlbumService::live_clusters(const AlbumMetadata& live,
                                                       const AlbumView* committed) const {
    std::vector<PersonCluster> clusters = clusterer.cluster(live);

    // Los links de la vista publicada se conservan; solo se enlaza lo nuevo
    if (committed) {
        std::map<FaceRef, std::string> links;
        for (const auto& c : committed->clusters) {
            if (c.global_id) links[c.representative] = *c.global_id;
        }
        for (auto& c : clusters) {
            auto it = links.find(c.representative);
            if (it != links.end()) c.global_id = it->second;
        }
    }

    matcher.link(clusters);
    return clusters;
}

std::vector<RankedPhoto> AlbumService::ranked_photos(const std::string& album_id,
                                                     const std::string& person_ref,
                                                     int top_k,
                                                     bool use_cache) const {
    require_album(album_id);
    PersonRef ref = PersonRef::parse(person_ref);
    auto view = view_for(album_id);
    auto people = registry.snapshot();

    RankTarget target;

    if (ref.kind == PersonRef::Kind::AlbumCluster) {
        if (ref.album_id != album_id || !view) {
            throw photorank::PersonNotFoundError("Unknown person: " + person_ref);
        }
        const PersonCluster& cluster = find_cluster(*view, ref.cluster_index);

        // Un cluster enlazado representa a toda la persona global del album
        if (auto person = linked_person(cluster, people)) {
            target.global_id = person->id;
        } else {
            target.representative = cluster.representative;
        }
    } else {
        if (!registry.contains(ref.global_id)) {
            throw photorank::PersonNotFoundError("Unknown person: " + ref.global_id);
        }
        target.global_id = ref.global_id;
    }

    if (!use_cache) {
        return ranker.rank_live(album_dir(album_id), require_extractor(),
                                [&](const AlbumMetadata& live) {
                                    return select_targets(live_clusters(live, view.get()), target);
                                },
                                top_k);
    }

    if (!view) return {};
    return ranker.rank(*view->metadata, select_targets(view->clusters, target), top_k);
}

MatchResult AlbumService::find_person(const cv::Mat& query_image, float threshold, int top_k) const {
    auto faces = require_extractor().detect_faces(query_image);

    auto selected = IdentityMatcher::select_query_face(faces);
    if (!selected) {
        throw photorank::NoFaceFoundError("No face found in query image");
    }
    if (faces.size() > 1) {
        spdlog::info("Query con {} rostros: se usa el mas grande", faces.size());
    }

    return matcher.find(faces[*selected].embedding, threshold, top_k, committed_views());
}

PersonResolution AlbumService::resolve(const std::string& person_ref) const {
    PersonRef ref = PersonRef::parse(person_ref);
    auto people = registry.snapshot();

    PersonResolution res;
    res.ref = person_ref;

    if (ref.kind == PersonRef::Kind::AlbumCluster) {
        require_album(ref.album_id);
        auto view = view_for(ref.album_id);
        if (!view) {
            throw photorank::PersonNotFoundError("Unknown person: " + person_ref);
        }
        const PersonCluster& cluster = find_cluster(*view, ref.cluster_index);

        auto person = linked_person(cluster, people);
        if (!person) {
            res.name = IdentityMatcher::cluster_display_name(ref.album_id, ref.cluster_index);

            AlbumAppearance a;
            a.album_id = ref.album_id;
            a.cluster_index = cluster.cluster_index;
            for (const auto& m : cluster.members) a.photos.push_back(m.filename);
            a.photos.erase(std::unique(a.photos.begin(), a.photos.end()), a.photos.end());
            res.appearances.push_back(std::move(a));
            return res;
        }
        ref = PersonRef::global(person->id);
    }

    auto person = registry.get(ref.global_id);
    if (!person) {
        throw photorank::PersonNotFoundError("Unknown person: " + ref.global_id);
    }
    res.name = person->name;
    res.global_id = person->id;

    for (const auto& view : committed_views()) {
        for (const auto& c : view.clusters) {
            if (!c.global_id || *c.global_id != person->id) continue;

            AlbumAppearance a;
            a.album_id = view.album_id;
            a.cluster_index = c.cluster_index;
            for (const auto& m : c.members) a.photos.push_back(m.filename);
            a.photos.erase(std::unique(a.photos.begin(), a.photos.end()), a.photos.end());
            res.appearances.push_back(std::move(a));
        }
    }
    return res;
}

std::vector<PhotoFace> AlbumService::faces_in_photo(const std::string& album_id, const std::string& filename) const {
    require_album(album_id);

    std::vector<PhotoFace> out;
    auto view = view_for(album_id);
    if (!view) return out;

    if (view->metadata->count(filename) == 0) {
        spdlog::warn("Foto {} no esta en el cache de {}", filename, album_id);
        return out;
    }

    auto people = registry.snapshot();
    for (const auto& a : IdentityClusterer::face_assignments(*view->metadata, view->clusters, filename)) {
        PhotoFace f;
        f.face_index = a.face_index;
        f.bbox = a.bbox;
        f.cluster_index = a.cluster_index;

        if (a.cluster_index) {
            const PersonCluster& c = find_cluster(*view, *a.cluster_index);
            if (auto person = linked_person(c, people)) {
                f.ref = person->id;
                f.name = person->name;
            } else {
                f.ref = PersonRef::cluster(album_id, *a.cluster_index).to_string();
                f.name = IdentityMatcher::cluster_display_name(album_id, *a.cluster_index);
            }
        }
        out.push_back(std::move(f));
    }
    return out;
}

// ==================== ESCRITURA ====================

GlobalPerson AlbumService::rename_person(const std::string& person_ref, const std::string& name) {
    PersonRef ref = PersonRef::parse(person_ref);

    if (ref.kind == PersonRef::Kind::Global) {
        return matcher.rename(ref, name, nullptr);
    }

    require_album(ref.album_id);
    auto state = state_for(ref.album_id);

    // Serializado con el pipeline del album: la vista publicada incluye el link
    std::lock_guard<std::mutex> pipeline_lock(state->pipeline_mutex);

    auto view = view_for(ref.album_id);
    if (!view) {
        throw photorank::PersonNotFoundError("Unknown person: " + person_ref);
    }

    AlbumView updated = *view;
    GlobalPerson person = matcher.rename(ref, name, &updated);
    publish(*state, std::make_shared<const AlbumView>(std::move(updated)));
    return person;
}

void AlbumService::remove_person(const std::string& global_id) {
    registry.remove(global_id);

    std::vector<std::shared_ptr<AlbumState>> states;
    {
        std::lock_guard<std::mutex> lock(albums_mutex);
        for (const auto& [id, state] : albums) states.push_back(state);
    }

    for (const auto& state : states) {
        auto view = std::atomic_load(&state->view);
        if (!view) continue;

        bool touched = std::any_of(view->clusters.begin(), view->clusters.end(), [&](const PersonCluster& c) {
            return c.global_id && *c.global_id == global_id;
        });
        if (!touched) continue;

        AlbumView updated = *view;
        for (auto& c : updated.clusters) {
            if (c.global_id && *c.global_id == global_id) c.global_id.reset();
        }
        publish(*state, std::make_shared<const AlbumView>(std::move(updated)));
    }
}
