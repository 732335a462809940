#include <gtest/gtest.h>
#include "consensus/similarity.hh"
#include <cmath>

using namespace oracle;

// ============================================================================
// Cosine Similarity Tests
// ============================================================================

TEST(CosineSimilarityTest, SelfSimilarityIsOne) {
    std::vector<double> v = {-0.18, -0.15, -0.20, -0.17};
    EXPECT_EQ(cosine_similarity(v, v), 1.0);

    std::vector<double> w = {3.0, 1.0, 0.0, 0.0};
    EXPECT_EQ(cosine_similarity(w, w), 1.0);
}

TEST(CosineSimilarityTest, Symmetric) {
    std::vector<double> a = {0.3, -1.2, 4.5, 0.01};
    std::vector<double> b = {-2.0, 0.7, 1.1, 9.0};
    EXPECT_EQ(cosine_similarity(a, b), cosine_similarity(b, a));
}

TEST(CosineSimilarityTest, KnownValues) {
    std::vector<double> a = {3, 1, 0, 0};
    std::vector<double> b = {3, 0, 1, 0};
    EXPECT_NEAR(cosine_similarity(a, b), 0.9, 1e-12);

    std::vector<double> x = {1, 0};
    std::vector<double> y = {0, 1};
    std::vector<double> z = {-1, 0};
    EXPECT_NEAR(cosine_similarity(x, y), 0.0, 1e-12);
    EXPECT_NEAR(cosine_similarity(x, z), -1.0, 1e-12);
}

TEST(CosineSimilarityTest, ZeroNormIsZero) {
    std::vector<double> zero = {0, 0, 0};
    std::vector<double> v = {1, 2, 3};
    EXPECT_EQ(cosine_similarity(zero, v), 0.0);
    EXPECT_EQ(cosine_similarity(zero, zero), 0.0);
}

TEST(CosineSimilarityTest, MismatchedOrEmptyIsZero) {
    std::vector<double> a = {1, 2, 3};
    std::vector<double> b = {1, 2};
    EXPECT_EQ(cosine_similarity(a, b), 0.0);
    EXPECT_EQ(cosine_similarity(std::span<const double>{}, std::span<const double>{}), 0.0);
}

// ============================================================================
// Similarity Matrix Tests
// ============================================================================

TEST(SimilarityMatrixTest, MeansOverUniformCluster) {
    SimilarityMatrix m({{3, 1, 0, 0}, {3, 0, 1, 0}, {3, 0, 0, 1}});
    ASSERT_EQ(m.size(), 3);
    EXPECT_EQ(m.at(1, 1), 1.0);
    EXPECT_EQ(m.at(0, 2), m.at(2, 0));
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_NEAR(m.mean_for(i), 0.9, 1e-12);
    }
    EXPECT_NEAR(m.mean_pairwise(), 0.9, 1e-12);
}

TEST(SimilarityMatrixTest, MaxAmongRows) {
    SimilarityMatrix m({{1, 0}, {1, 0.01}, {0, 1}});
    std::vector<std::size_t> rows = {0, 2};
    EXPECT_NEAR(m.max_among(rows), 0.0, 1e-12);

    std::vector<std::size_t> all = {0, 1, 2};
    EXPECT_GT(m.max_among(all), 0.99);
}

TEST(SimilarityMatrixTest, SingleRow) {
    SimilarityMatrix m({{1, 2, 3}});
    EXPECT_EQ(m.mean_for(0), 0.0);
    EXPECT_EQ(m.mean_pairwise(), 0.0);
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(StatisticsTest, MeanAndPopulationStdDev) {
    std::vector<double> v = {2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_DOUBLE_EQ(mean(v), 5.0);
    EXPECT_DOUBLE_EQ(std_dev(v), 2.0);
    EXPECT_DOUBLE_EQ(coefficient_of_variation(v), 0.4);
}

TEST(StatisticsTest, Degenerate) {
    std::vector<double> empty;
    std::vector<double> one = {3.0};
    std::vector<double> zeros = {0.0, 0.0};
    EXPECT_EQ(mean(empty), 0.0);
    EXPECT_EQ(std_dev(one), 0.0);
    EXPECT_EQ(coefficient_of_variation(zeros), 0.0);
}

// ============================================================================
// Spectral Entropy Tests
// ============================================================================

TEST(SpectralEntropyTest, UniformMagnitudesAreMaximal) {
    std::vector<double> v = {1, -1, 1, -1};
    EXPECT_NEAR(normalized_spectral_entropy(v), 1.0, 1e-12);
}

TEST(SpectralEntropyTest, SingleSpikeIsZero) {
    std::vector<double> v = {0, 0, 5, 0};
    EXPECT_NEAR(normalized_spectral_entropy(v), 0.0, 1e-12);
}

TEST(SpectralEntropyTest, KnownMidValue) {
    // p = {0.5, 0.25, 0.25, 0}: H = 1.5 bits over log2(4) = 2
    std::vector<double> v = {2, 1, -1, 0};
    EXPECT_NEAR(normalized_spectral_entropy(v), 0.75, 1e-12);
}

TEST(SpectralEntropyTest, DegenerateInputsAreZero) {
    std::vector<double> one = {3.0};
    std::vector<double> zeros = {0, 0, 0};
    EXPECT_EQ(normalized_spectral_entropy(one), 0.0);
    EXPECT_EQ(normalized_spectral_entropy(zeros), 0.0);
}
