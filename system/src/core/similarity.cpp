// ============= src/core/similarity.cpp =============
#include "core/similarity.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace photorank {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        spdlog::error("Embedding size mismatch: {} vs {}", a.size(), b.size());
        return 0.0f;
    }

    // Embeddings ya normalizados: cosine == dot product
    float dot = 0.0f;
    for (size_t i = 0; i < a.size(); i++) {
        dot += a[i] * b[i];
    }

    return std::max(-1.0f, std::min(1.0f, dot));
}

bool l2_normalize(std::vector<float>& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (!(norm > 0.0f) || !std::isfinite(norm)) {
        return false;
    }

    for (float& val : embedding) {
        val /= norm;
    }
    return true;
}

} // namespace photorank
