#pragma once

#include "core/types.hh"
#include <span>
#include <vector>

namespace oracle {

// ============================================================================
// Vector Similarity
// ============================================================================

// dot(a, b) / (|a| * |b|), clamped to [-1, 1]. Zero when either vector is
// all zeros, empty, or the dimensions differ.
[[nodiscard]] double cosine_similarity(std::span<const double> a, std::span<const double> b);

// Symmetric pairwise cosine similarity with a unit diagonal
class SimilarityMatrix {
public:
    explicit SimilarityMatrix(const std::vector<std::vector<double>>& vectors);

    [[nodiscard]] std::size_t size() const { return n_; }
    [[nodiscard]] double at(std::size_t i, std::size_t j) const { return values_[i * n_ + j]; }

    // Mean similarity of row i against every other row
    [[nodiscard]] double mean_for(std::size_t i) const;

    // Mean over all unordered pairs
    [[nodiscard]] double mean_pairwise() const;

    // Largest similarity among pairs drawn from the given rows
    [[nodiscard]] double max_among(std::span<const std::size_t> rows) const;

private:
    std::size_t n_;
    std::vector<double> values_;
};

// ============================================================================
// Descriptive Statistics
// ============================================================================

[[nodiscard]] double mean(std::span<const double> values);

// Population standard deviation
[[nodiscard]] double std_dev(std::span<const double> values);

// std_dev / |mean|; zero when the mean is zero
[[nodiscard]] double coefficient_of_variation(std::span<const double> values);

// ============================================================================
// Spectral Entropy
// ============================================================================

// Shannon entropy of |x_i| / sum|x_j| in bits, divided by log2(n) so the
// result lies in [0, 1]. Vectors shorter than two or with no mass score 0.
[[nodiscard]] double normalized_spectral_entropy(std::span<const double> values);

}  // namespace oracle
