// ============= include/matching/identity_matcher.hpp =============
/*
 * Identity Matcher - clusters de album <-> personas globales
 *
 * link():   cluster sin global_id -> mejor persona global si sim > link_threshold
 *           (links colgantes se descartan con warning)
 * find():   busqueda por embedding sobre personas globales + clusters de todos
 *           los albums. Match si best >= threshold; si no, top_k candidatos
 * rename(): persona global o cluster (crea la persona y enlaza)
 *
 * ORDEN DE CANDIDATOS (desempate):
 *   globales por created_seq -> albums por id -> cluster_index
 */

#pragma once
#include "config/ranking_config.hpp"
#include "face_types.hpp"
#include "matching/person_registry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Referencia textual a una persona: "<global_id>" o "<album_id>:<cluster_index>"
struct PersonRef {
    enum class Kind { Global, AlbumCluster };

    Kind kind = Kind::Global;
    std::string global_id;
    std::string album_id;
    int cluster_index = -1;

    static PersonRef global(const std::string& id);
    static PersonRef cluster(const std::string& album_id, int index);

    // Lanza photorank::PersonNotFoundError si el texto no es una referencia valida
    static PersonRef parse(const std::string& text);

    std::string to_string() const;
};

struct MatchCandidate {
    std::string ref;          // global id o "<album>:<idx>"
    std::string name;
    std::string global_id;    // vacio si es un cluster sin enlazar
    std::string album_id;     // vacio si es global
    int cluster_index = -1;
    float similarity = -1.0f;
};

struct MatchResult {
    bool matched = false;
    std::optional<MatchCandidate> match;
    std::vector<MatchCandidate> candidates;   // solo si !matched
    float best_similarity = -1.0f;
};

class IdentityMatcher {
private:
    PersonRegistry& registry;
    MatchingConfig config;

public:
    IdentityMatcher(PersonRegistry& registry, const MatchingConfig& config);

    // Devuelve cuantos clusters quedaron enlazados en este paso
    int link(std::vector<PersonCluster>& clusters) const;

    MatchResult find(const std::vector<float>& query,
                     float threshold,
                     int top_k,
                     const std::vector<AlbumView>& albums) const;

    // Lanza photorank::PersonNotFoundError si la referencia no existe.
    // album: vista del album para referencias de cluster (se actualiza su global_id)
    GlobalPerson rename(const PersonRef& ref, const std::string& name, AlbumView* album) const;

    // Rostro mas grande (area de bbox); nullopt si no hay rostros
    static std::optional<size_t> select_query_face(const std::vector<DetectedFace>& faces);

    static std::string cluster_display_name(const std::string& album_id, int index);
};
