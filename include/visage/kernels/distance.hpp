#pragma once

/** \file distance.hpp
 *  \brief Scalar similarity kernels over face descriptors.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * - unit_similarity() assumes both inputs are L2-normalised
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace visage::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Euclidean norm. O(d). */
inline float norm(std::span<const float> a) noexcept {
  return std::sqrt(inner_product(a, a));
}

/** \brief Cosine similarity for arbitrary non-zero vectors. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const float denom = norm(a) * norm(b);
  return inner_product(a, b) / denom; // UB if denom==0 per preconditions
}

/** \brief Cosine similarity of two unit vectors.
 *
 * Equal to 1 - l2_sq(a,b)/2 for unit inputs; computed as the inner product and
 * clamped to [-1, 1] to absorb rounding.
 */
inline float unit_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const float s = inner_product(a, b);
  return s > 1.0f ? 1.0f : (s < -1.0f ? -1.0f : s);
}

/** \brief Scale v to unit length in place. Returns false (v untouched) for a zero
 *  or non-finite norm. */
inline bool normalize(std::span<float> v) noexcept {
  const float n = norm(v);
  if (!(n > 0.0f) || !std::isfinite(n)) return false;
  const float inv = 1.0f / n;
  for (auto& x : v) x *= inv;
  return true;
}

/** \brief True if every element is finite. */
inline bool all_finite(std::span<const float> v) noexcept {
  for (float x : v) {
    if (!std::isfinite(x)) return false;
  }
  return true;
}

} // namespace visage::kernels
