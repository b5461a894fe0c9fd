/**
 * Tests for the Fisher exact test engine: tails, degenerate tables,
 * range and error reporting.
 */

#include <gtest/gtest.h>
#include "exact_test.hpp"

#include <limits>
#include <vector>

using namespace goenrich;

static const double kTolerance = 1e-9;

// ============================================================================
// Known values
// ============================================================================

TEST(FisherExact, SyntheticGenomeTable) {
    // N=5, n=3, K=2, a=2: P(X >= 2) = C(2,2)C(3,1)/C(5,3) = 3/10
    ContingencyTable table{2, 1, 0, 2};
    EXPECT_NEAR(fisher_exact_test(table), 0.3, kTolerance);
    EXPECT_NEAR(fisher_exact_test(table, Alternative::LESS), 1.0, kTolerance);
}

TEST(FisherExact, TeaTasting) {
    // Hypergeometric probabilities for x = 0..4: 1, 16, 36, 16, 1 (/70)
    ContingencyTable table{3, 1, 1, 3};
    FisherResult result = fisher_exact(table);

    EXPECT_NEAR(result.right, 17.0 / 70.0, kTolerance);
    EXPECT_NEAR(result.left, 69.0 / 70.0, kTolerance);
    EXPECT_NEAR(result.two_sided, 34.0 / 70.0, kTolerance);
}

TEST(FisherExact, AlternativeSelectsTail) {
    ContingencyTable table{3, 1, 1, 3};
    EXPECT_NEAR(fisher_exact_test(table, Alternative::GREATER), 17.0 / 70.0, kTolerance);
    EXPECT_NEAR(fisher_exact_test(table, Alternative::LESS), 69.0 / 70.0, kTolerance);
    EXPECT_NEAR(fisher_exact_test(table, Alternative::TWO_SIDED), 34.0 / 70.0, kTolerance);
}

TEST(FisherExact, DepletedTermLeftTail) {
    // N=8, n=4, K=4, a=1: P(X <= 1) = 17/70
    ContingencyTable table{1, 3, 3, 1};
    EXPECT_NEAR(fisher_exact_test(table, Alternative::LESS), 17.0 / 70.0, kTolerance);
    EXPECT_NEAR(fisher_exact_test(table, Alternative::GREATER), 69.0 / 70.0, kTolerance);
}

// ============================================================================
// Extremes
// ============================================================================

TEST(FisherExact, NoOverlapIsNeverSignificant) {
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 3, 2, 0}), 1.0);
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 2, 3, 5}), 1.0);
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 10, 40, 950}), 1.0);
}

TEST(FisherExact, ExclusiveAnnotationGivesMinimum) {
    // N=10, n=K=a=3: P = 1 / C(10,3)
    ContingencyTable exclusive{3, 0, 0, 7};
    double p_min = fisher_exact_test(exclusive);
    EXPECT_NEAR(p_min, 1.0 / 120.0, kTolerance);

    // Every other table with the same marginals gives a larger value
    for (int64_t a = 0; a < 3; ++a) {
        ContingencyTable other{a, 3 - a, 3 - a, 4 + a};
        EXPECT_GT(fisher_exact_test(other), p_min) << "a=" << a;
    }
}

TEST(FisherExact, LargeEnrichment) {
    // N=20, n=K=a=5: P = 1 / C(20,5)
    ContingencyTable table{5, 0, 0, 15};
    EXPECT_NEAR(fisher_exact_test(table), 1.0 / 15504.0, 1e-12);
}

// ============================================================================
// Degenerate tables
// ============================================================================

TEST(FisherExact, EmptySetOfInterest) {
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 0, 2, 3}), 1.0);
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 0, 2, 3}, Alternative::LESS), 1.0);
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 0, 2, 3}, Alternative::TWO_SIDED), 1.0);
}

TEST(FisherExact, AllZeroTable) {
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{0, 0, 0, 0}), 1.0);
}

TEST(FisherExact, ZeroColumn) {
    // Term covers the whole genome
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{3, 0, 7, 0}), 1.0);
    // Set covers the whole genome
    EXPECT_DOUBLE_EQ(fisher_exact_test(ContingencyTable{2, 8, 0, 0}), 1.0);
}

TEST(FisherExact, ValuesInUnitInterval) {
    std::vector<ContingencyTable> tables = {
        {0, 5, 5, 90}, {1, 4, 4, 91}, {2, 3, 3, 92}, {5, 0, 0, 95},
        {10, 90, 20, 880}, {50, 50, 50, 850}, {1, 0, 0, 0}, {7, 3, 1, 400},
        {200, 300, 100, 9400},
    };

    for (const auto& table : tables) {
        for (auto alt : {Alternative::GREATER, Alternative::LESS, Alternative::TWO_SIDED}) {
            double p = fisher_exact_test(table, alt);
            EXPECT_GE(p, 0.0);
            EXPECT_LE(p, 1.0);
        }
    }
}

TEST(FisherExact, MoreOverlapIsMoreSignificant) {
    // Fixed marginals N=100, n=10, K=20
    double previous = 1.0;
    for (int64_t a = 0; a <= 10; ++a) {
        ContingencyTable table{a, 10 - a, 20 - a, 70 + a};
        double p = fisher_exact_test(table);
        EXPECT_LE(p, previous + kTolerance) << "a=" << a;
        previous = p;
    }
}

TEST(FisherExact, OrdinaryTablesDoNotUnderflow) {
    EXPECT_FALSE(fisher_exact(ContingencyTable{3, 1, 1, 3}).underflow);
    EXPECT_FALSE(fisher_exact(ContingencyTable{5, 0, 0, 15}).underflow);
    EXPECT_FALSE(fisher_exact(ContingencyTable{0, 0, 2, 3}).underflow);
    EXPECT_FALSE(fisher_exact(ContingencyTable{0, 0, 0, 0}).underflow);
}

TEST(FisherExact, ExtremeTableFlagsUnderflow) {
    // log10 P(X = 300) is about -428.8, below the smallest double
    ContingencyTable table{300, 200, 200, 27000};
    FisherResult result = fisher_exact(table);

    EXPECT_TRUE(result.underflow);
    EXPECT_LT(result.right, 1e-300);
    EXPECT_LT(result.two_sided, 1e-300);
    EXPECT_NEAR(result.left, 1.0, kTolerance);

    EXPECT_GE(fisher_exact_test(table), 0.0);
    EXPECT_NEAR(fisher_exact_test(table, Alternative::LESS), 1.0, kTolerance);
}

TEST(FisherExact, TailProbabilitySelectsTail) {
    FisherResult result;
    result.left = 0.25;
    result.right = 0.75;
    result.two_sided = 0.5;
    EXPECT_DOUBLE_EQ(tail_probability(result, Alternative::GREATER), 0.75);
    EXPECT_DOUBLE_EQ(tail_probability(result, Alternative::LESS), 0.25);
    EXPECT_DOUBLE_EQ(tail_probability(result, Alternative::TWO_SIDED), 0.5);
}

// ============================================================================
// Errors
// ============================================================================

TEST(FisherExact, NegativeCountThrows) {
    EXPECT_THROW(fisher_exact_test(ContingencyTable{-1, 2, 3, 4}), ValidationError);
    EXPECT_THROW(fisher_exact_test(ContingencyTable{1, 2, 3, -4}), ValidationError);
}

TEST(FisherExact, OversizedTableThrows) {
    const int64_t big = static_cast<int64_t>(std::numeric_limits<int>::max()) + 1;
    EXPECT_THROW(fisher_exact_test(ContingencyTable{1, 1, 1, big}), ComputationError);

    const int64_t half = std::numeric_limits<int>::max() / 2 + 1;
    EXPECT_THROW(fisher_exact_test(ContingencyTable{0, half, 0, half}), ComputationError);
}
