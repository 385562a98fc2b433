// ============= src/matching/identity_matcher.cpp =============
#include "matching/identity_matcher.hpp"
#include "core/errors.hpp"
#include "core/similarity.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

// ==================== PersonRef ====================

PersonRef PersonRef::global(const std::string& id) {
    PersonRef ref;
    ref.kind = Kind::Global;
    ref.global_id = id;
    return ref;
}

PersonRef PersonRef::cluster(const std::string& album_id, int index) {
    PersonRef ref;
    ref.kind = Kind::AlbumCluster;
    ref.album_id = album_id;
    ref.cluster_index = index;
    return ref;
}

PersonRef PersonRef::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        if (text.empty()) {
            throw photorank::PersonNotFoundError("Empty person reference");
        }
        return global(text);
    }

    std::string album = text.substr(0, colon);
    std::string index = text.substr(colon + 1);
    if (album.empty() || index.empty() ||
        !std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw photorank::PersonNotFoundError("Invalid person reference: " + text);
    }

    try {
        return cluster(album, std::stoi(index));
    } catch (const std::out_of_range&) {
        throw photorank::PersonNotFoundError("Invalid person reference: " + text);
    }
}

std::string PersonRef::to_string() const {
    if (kind == Kind::Global) return global_id;
    return album_id + ":" + std::to_string(cluster_index);
}

// ==================== IdentityMatcher ====================

IdentityMatcher::IdentityMatcher(PersonRegistry& registry, const MatchingConfig& config)
    : registry(registry), config(config)
{
}

std::string IdentityMatcher::cluster_display_name(const std::string& album_id, int index) {
    return album_id + " #" + std::to_string(index);
}

int IdentityMatcher::link(std::vector<PersonCluster>& clusters) const {
    auto people = registry.snapshot();

    std::set<std::string> known;
    for (const auto& p : *people) known.insert(p.id);

    int linked = 0;
    for (auto& c : clusters) {
        if (c.global_id && known.count(*c.global_id) == 0) {
            spdlog::warn("⚠️  Cluster {} enlazado a persona inexistente {}: link descartado",
                         c.cluster_index, *c.global_id);
            c.global_id.reset();
        }
        if (c.global_id) continue;

        // Snapshot en orden de creacion: el primero gana los empates
        const GlobalPerson* best = nullptr;
        float best_sim = -2.0f;
        for (const auto& p : *people) {
            float sim = photorank::cosine_similarity(c.representative_embedding, p.representative_embedding);
            if (sim > best_sim) {
                best_sim = sim;
                best = &p;
            }
        }

        if (best && best_sim > config.link_threshold) {
            c.global_id = best->id;
            ++linked;
            spdlog::info("🔗 Cluster {} -> {} ({}) sim={:.3f}",
                         c.cluster_index, best->name, best->id, best_sim);
        }
    }
    return linked;
}

MatchResult IdentityMatcher::find(const std::vector<float>& query,
                                  float threshold,
                                  int top_k,
                                  const std::vector<AlbumView>& albums) const {
    std::vector<MatchCandidate> candidates;
    std::map<std::string, size_t> global_slot;

    // 1. Personas globales por orden de creacion
    std::vector<GlobalPerson> people(*registry.snapshot());
    std::stable_sort(people.begin(), people.end(), [](const GlobalPerson& a, const GlobalPerson& b) {
        return a.created_seq < b.created_seq;
    });

    for (const auto& p : people) {
        MatchCandidate c;
        c.ref = p.id;
        c.name = p.name;
        c.global_id = p.id;
        c.similarity = photorank::cosine_similarity(query, p.representative_embedding);
        global_slot[p.id] = candidates.size();
        candidates.push_back(std::move(c));
    }

    // 2. Clusters de cada album (albums por id, clusters por indice)
    std::vector<const AlbumView*> ordered;
    for (const auto& a : albums) ordered.push_back(&a);
    std::sort(ordered.begin(), ordered.end(), [](const AlbumView* a, const AlbumView* b) {
        return a->album_id < b->album_id;
    });

    for (const AlbumView* album : ordered) {
        for (const auto& cluster : album->clusters) {
            float sim = photorank::cosine_similarity(query, cluster.representative_embedding);

            if (cluster.global_id) {
                auto slot = global_slot.find(*cluster.global_id);
                if (slot != global_slot.end()) {
                    auto& g = candidates[slot->second];
                    g.similarity = std::max(g.similarity, sim);
                    continue;
                }
            }

            MatchCandidate c;
            c.ref = PersonRef::cluster(album->album_id, cluster.cluster_index).to_string();
            c.name = cluster_display_name(album->album_id, cluster.cluster_index);
            c.album_id = album->album_id;
            c.cluster_index = cluster.cluster_index;
            c.similarity = sim;
            candidates.push_back(std::move(c));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const MatchCandidate& a, const MatchCandidate& b) {
        return a.similarity > b.similarity;
    });

    MatchResult result;
    if (candidates.empty()) return result;

    result.best_similarity = candidates.front().similarity;
    if (result.best_similarity >= threshold) {
        result.matched = true;
        result.match = candidates.front();
        spdlog::info("🎯 Match: {} sim={:.3f} (thr {:.2f})",
                     result.match->name, result.best_similarity, threshold);
        return result;
    }

    if (top_k > 0 && candidates.size() > static_cast<size_t>(top_k)) {
        candidates.resize(top_k);
    }
    result.candidates = std::move(candidates);
    spdlog::info("Sin match (best {:.3f} < {:.2f}), {} candidatos",
                 result.best_similarity, threshold, result.candidates.size());
    return result;
}

GlobalPerson IdentityMatcher::rename(const PersonRef& ref, const std::string& name, AlbumView* album) const {
    if (ref.kind == PersonRef::Kind::Global) {
        return registry.rename(ref.global_id, name);
    }

    if (!album || album->album_id != ref.album_id) {
        throw photorank::PersonNotFoundError("Album not loaded for " + ref.to_string());
    }

    auto it = std::find_if(album->clusters.begin(), album->clusters.end(),
                           [&](const PersonCluster& c) { return c.cluster_index == ref.cluster_index; });
    if (it == album->clusters.end()) {
        throw photorank::PersonNotFoundError("Unknown person: " + ref.to_string());
    }

    if (it->global_id && registry.contains(*it->global_id)) {
        return registry.rename(*it->global_id, name);
    }

    GlobalPerson person = registry.add(name, it->representative_embedding, it->crop_path);
    it->global_id = person.id;
    return person;
}

std::optional<size_t> IdentityMatcher::select_query_face(const std::vector<DetectedFace>& faces) {
    if (faces.empty()) return std::nullopt;

    size_t best = 0;
    for (size_t i = 1; i < faces.size(); ++i) {
        if (faces[i].bbox.area() > faces[best].bbox.area()) {
            best = i;
        }
    }
    return best;
}
