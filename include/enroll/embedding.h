/**
 * @file embedding.h
 * @brief Embedding checks and comparison.
 */

#pragma once

#include "export.h"
#include "status.h"

#include <cstddef>
#include <vector>

namespace enroll {

/** @brief Default match threshold on cosine similarity. */
inline constexpr float kDefaultMatchThreshold = 0.6f;

/**
 * @brief Rejects embeddings that cannot be stored for matching.
 *
 * Requires: length == @p expected_dim, all values finite, L2 norm within 0.1 of 1, and not
 * all values equal (within 1e-6).
 */
[[nodiscard]] ENROLL_API Status validate_embedding(const std::vector<float>& v, int expected_dim) noexcept;

/** @brief Scales @p v to unit L2 norm in place; a zero vector is left unchanged. */
ENROLL_API void l2_normalize(std::vector<float>& v) noexcept;

/** @brief Cosine similarity; 0 for mismatched lengths or a zero-norm operand. */
[[nodiscard]] ENROLL_API float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) noexcept;

[[nodiscard]] ENROLL_API bool verify_face(const std::vector<float>& a, const std::vector<float>& b,
                                          float threshold = kDefaultMatchThreshold) noexcept;

} // namespace enroll
