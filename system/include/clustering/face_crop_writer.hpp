// ============= include/clustering/face_crop_writer.hpp =============
/*
 * Crops de representantes: <album>/.photorank_faces/<archivo>_<ext>_<idx>.jpg
 *
 * El nombre sale del FaceRef del representante, asi que se mantiene
 * estable entre pases aunque cambie cluster_index.
 */

#pragma once
#include "face_types.hpp"
#include <string>
#include <vector>

class FaceCropWriter {
private:
    std::string crop_dir;
    int crop_size;

public:
    FaceCropWriter(const std::string& album_dir, const std::string& crop_dirname, int crop_size);

    // Escribe un crop por cluster, rellena crop_path y borra crops viejos.
    // Devuelve cuantos crops se escribieron
    int write_all(const std::string& album_dir, std::vector<PersonCluster>& clusters) const;

    // Solo rellena crop_path (crops ya escritos por un pase anterior)
    void assign_paths(std::vector<PersonCluster>& clusters) const;

    static std::string crop_name(const FaceRef& ref);

    // Region cuadrada centrada en el bbox, recortada a la imagen
    static cv::Rect square_region(const BoundingBox& bbox, const cv::Size& image_size);
};
