#pragma once

/** \file distance.hpp
 *  \brief Scalar cosine kernels used by the in-process vector backend.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Zero-norm inputs have similarity 0 (distance 1) instead of being undefined,
 * since an embedding of text without keywords can be the zero vector.
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace saffron::kernels {

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||), in [-1, 1]. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size() < b.size() ? a.size() : b.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for all three sums
  float dot0 = 0.0f, dot1 = 0.0f, dot2 = 0.0f, dot3 = 0.0f;
  float na0 = 0.0f, na1 = 0.0f, na2 = 0.0f, na3 = 0.0f;
  float nb0 = 0.0f, nb1 = 0.0f, nb2 = 0.0f, nb3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    dot0 += pa[i] * pb[i];         na0 += pa[i] * pa[i];         nb0 += pb[i] * pb[i];
    dot1 += pa[i + 1] * pb[i + 1]; na1 += pa[i + 1] * pa[i + 1]; nb1 += pb[i + 1] * pb[i + 1];
    dot2 += pa[i + 2] * pb[i + 2]; na2 += pa[i + 2] * pa[i + 2]; nb2 += pb[i + 2] * pb[i + 2];
    dot3 += pa[i + 3] * pb[i + 3]; na3 += pa[i + 3] * pa[i + 3]; nb3 += pb[i + 3] * pb[i + 3];
  }

  float dot = dot0 + dot1 + dot2 + dot3;
  float na = na0 + na1 + na2 + na3;
  float nb = nb0 + nb1 + nb2 + nb3;

  // Handle remaining elements
  for (; i < n; ++i) {
    dot += pa[i] * pb[i];
    na += pa[i] * pa[i];
    nb += pb[i] * pb[i];
  }

  const float denom = std::sqrt(na) * std::sqrt(nb);
  if (!(denom > 0.0f)) return 0.0f;
  return dot / denom;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b), in [0, 2]. O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

} // namespace saffron::kernels
