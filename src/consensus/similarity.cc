#include "similarity.hh"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace oracle {

double cosine_similarity(std::span<const double> a, std::span<const double> b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    // sqrt(x * x) == x exactly, so a vector against itself scores 1.0
    double denom = std::sqrt(norm_a * norm_b);
    if (!std::isfinite(denom) || denom == 0.0) {
        return 0.0;
    }
    return std::clamp(dot / denom, -1.0, 1.0);
}

// ============================================================================
// SimilarityMatrix Implementation
// ============================================================================

SimilarityMatrix::SimilarityMatrix(const std::vector<std::vector<double>>& vectors)
    : n_(vectors.size())
    , values_(n_ * n_, 0.0) {
    for (std::size_t i = 0; i < n_; ++i) {
        values_[i * n_ + i] = 1.0;
        for (std::size_t j = i + 1; j < n_; ++j) {
            double s = cosine_similarity(vectors[i], vectors[j]);
            values_[i * n_ + j] = s;
            values_[j * n_ + i] = s;
        }
    }
}

double SimilarityMatrix::mean_for(std::size_t i) const {
    if (n_ < 2) {
        return 0.0;
    }
    double sum = 0.0;
    for (std::size_t j = 0; j < n_; ++j) {
        if (j != i) {
            sum += at(i, j);
        }
    }
    return sum / static_cast<double>(n_ - 1);
}

double SimilarityMatrix::mean_pairwise() const {
    if (n_ < 2) {
        return 0.0;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < n_; ++i) {
        for (std::size_t j = i + 1; j < n_; ++j) {
            sum += at(i, j);
        }
    }
    return sum / static_cast<double>(n_ * (n_ - 1) / 2);
}

double SimilarityMatrix::max_among(std::span<const std::size_t> rows) const {
    double best = 0.0;
    bool any = false;
    for (std::size_t x = 0; x < rows.size(); ++x) {
        for (std::size_t y = x + 1; y < rows.size(); ++y) {
            double s = at(rows[x], rows[y]);
            if (!any || s > best) {
                best = s;
                any = true;
            }
        }
    }
    return best;
}

// ============================================================================
// Descriptive Statistics
// ============================================================================

double mean(std::span<const double> values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double std_dev(std::span<const double> values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return std::sqrt(acc / static_cast<double>(values.size()));
}

double coefficient_of_variation(std::span<const double> values) {
    double m = mean(values);
    if (m == 0.0) {
        return 0.0;
    }
    return std_dev(values) / std::fabs(m);
}

// ============================================================================
// Spectral Entropy
// ============================================================================

double normalized_spectral_entropy(std::span<const double> values) {
    if (values.size() < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (double v : values) {
        total += std::fabs(v);
    }
    if (total == 0.0 || !std::isfinite(total)) {
        return 0.0;
    }

    double entropy = 0.0;
    for (double v : values) {
        double p = std::fabs(v) / total;
        if (p > 0.0) {
            entropy -= p * std::log2(p);
        }
    }

    double normalized = entropy / std::log2(static_cast<double>(values.size()));
    return std::clamp(normalized, 0.0, 1.0);
}

}  // namespace oracle
