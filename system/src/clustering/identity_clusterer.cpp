// ============= src/clustering/identity_clusterer.cpp =============
#include "clustering/identity_clusterer.hpp"
#include "core/similarity.hpp"
#include <spdlog/spdlog.h>

IdentityClusterer::IdentityClusterer(float threshold) : threshold(threshold) {}

std::vector<PersonCluster> IdentityClusterer::cluster(const AlbumMetadata& metadata) const {
    std::vector<PersonCluster> clusters;
    size_t total_faces = 0;

    // std::map -> filename ordenado; faces ya vienen en orden de face_index
    for (const auto& [filename, meta] : metadata) {
        if (meta.failed) continue;

        for (const auto& face : meta.faces) {
            if (face.embedding.empty()) continue;
            ++total_faces;

            FaceRef ref{filename, face.face_index};

            int best = -1;
            float best_sim = -2.0f;
            for (size_t i = 0; i < clusters.size(); ++i) {
                float sim = photorank::cosine_similarity(face.embedding, clusters[i].representative_embedding);
                if (sim > best_sim) {
                    best_sim = sim;
                    best = static_cast<int>(i);
                }
            }

            if (best >= 0 && best_sim >= threshold) {
                PersonCluster& c = clusters[best];
                c.members.insert(ref);

                // Estrictamente mayor: a igual area se queda el mas antiguo
                if (face.bbox.area() > c.representative_bbox.area()) {
                    c.representative = ref;
                    c.representative_embedding = face.embedding;
                    c.representative_bbox = face.bbox;
                }
            } else {
                PersonCluster c;
                c.cluster_index = static_cast<int>(clusters.size());
                c.representative = ref;
                c.representative_embedding = face.embedding;
                c.representative_bbox = face.bbox;
                c.members.insert(ref);
                clusters.push_back(std::move(c));
            }
        }
    }

    spdlog::info("👥 Clustering: {} rostros -> {} personas (thr {:.2f})",
                 total_faces, clusters.size(), threshold);
    return clusters;
}

const PersonCluster* IdentityClusterer::cluster_of(const std::vector<PersonCluster>& clusters,
                                                   const FaceRef& ref) {
    for (const auto& c : clusters) {
        if (c.members.count(ref)) return &c;
    }
    return nullptr;
}

std::vector<FaceAssignment> IdentityClusterer::face_assignments(const AlbumMetadata& metadata,
                                                                const std::vector<PersonCluster>& clusters,
                                                                const std::string& filename) {
    std::vector<FaceAssignment> out;

    auto it = metadata.find(filename);
    if (it == metadata.end()) return out;

    for (const auto& face : it->second.faces) {
        FaceAssignment a;
        a.face_index = face.face_index;
        a.bbox = face.bbox;
        if (const PersonCluster* c = cluster_of(clusters, FaceRef{filename, face.face_index})) {
            a.cluster_index = c->cluster_index;
        }
        out.push_back(a);
    }
    return out;
}
