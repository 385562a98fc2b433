// ============= include/clustering/identity_clusterer.hpp =============
/*
 * Identity Clusterer - personas unicas dentro de un album
 *
 * ALGORITMO (determinista):
 * - Rostros en orden (filename, face_index); entradas fallidas se saltan
 * - Cada rostro se compara con el representante de cada cluster
 * - max similarity >= threshold -> se une (empate -> cluster de menor indice)
 * - si no, nuevo cluster con el rostro como representante
 *
 * REPRESENTANTE: miembro con mayor area de bbox; a igual area gana
 * el primero en orden de procesamiento.
 *
 * cluster_index = orden de creacion. Solo valido dentro de un pase.
 */

#pragma once
#include "face_types.hpp"
#include <optional>
#include <string>
#include <vector>

struct FaceAssignment {
    int face_index = 0;
    BoundingBox bbox;
    std::optional<int> cluster_index;
};

class IdentityClusterer {
private:
    float threshold;

public:
    explicit IdentityClusterer(float threshold);

    std::vector<PersonCluster> cluster(const AlbumMetadata& metadata) const;

    static const PersonCluster* cluster_of(const std::vector<PersonCluster>& clusters, const FaceRef& ref);

    // Rostros de una foto con el cluster al que pertenecen
    static std::vector<FaceAssignment> face_assignments(const AlbumMetadata& metadata,
                                                        const std::vector<PersonCluster>& clusters,
                                                        const std::string& filename);
};
