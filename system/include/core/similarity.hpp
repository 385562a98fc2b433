// ============= include/core/similarity.hpp =============
#pragma once
#include <vector>

namespace photorank {

// Cosine similarity of two L2-normalized embeddings (plain dot product,
// clamped to [-1, 1]). Returns 0 on size mismatch.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Normalizes in place. Returns false (vector untouched) when the norm is zero.
bool l2_normalize(std::vector<float>& embedding);

} // namespace photorank
