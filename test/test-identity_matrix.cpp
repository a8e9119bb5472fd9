#include <sstream>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "errors.hpp"
#include "identity_matrix.hpp"
#include "sequence_store.hpp"

using namespace pairwise_heatmap;

SequenceCollection collection(const std::vector<std::pair<std::string, std::string>>& records)
{
    SequenceCollection result;
    for(const auto& r : records) {
        result.order.push_back(r.first);
        result.sequences[r.first] = r.second;
    }
    return result;
}

TEST(comparePair, no_gaps) {
    const PairIdentity p = comparePair("ACGT", "ACGA");
    EXPECT_EQ(3, p.matches);
    EXPECT_EQ(4, p.overlap);
    EXPECT_DOUBLE_EQ(75.0, p.percent());
}

TEST(comparePair, gap_columns_excluded) {
    const PairIdentity p = comparePair("AC-T", "-CGT");
    EXPECT_EQ(2, p.matches);
    EXPECT_EQ(2, p.overlap);
    EXPECT_DOUBLE_EQ(100.0, p.percent());
}

TEST(comparePair, no_overlap_is_zero) {
    EXPECT_DOUBLE_EQ(0.0, percentIdentity("AC--", "--GT"));
    EXPECT_DOUBLE_EQ(0.0, percentIdentity("----", "----"));
    EXPECT_DOUBLE_EQ(0.0, percentIdentity("", ""));
}

TEST(comparePair, truncates_to_shorter) {
    const PairIdentity p = comparePair("ACGTTTTT", "ACGA");
    EXPECT_EQ(4, p.overlap);
    EXPECT_EQ(3, p.matches);
}

TEST(comparePair, rounds_to_two_decimals) {
    // 1 of 3 columns
    EXPECT_DOUBLE_EQ(33.33, percentIdentity("ACG", "ATT"));
    // 2 of 3 columns
    EXPECT_DOUBLE_EQ(66.67, percentIdentity("ACG", "ACT"));
}

TEST(comparePair, exact_ties_round_to_even) {
    // 1 and 21 matches over 32 columns: 3.125% and 65.625%
    const std::string reference(32, 'A');
    std::string one(32, 'C'), many(32, 'C');
    one[0] = 'A';
    for(size_t i = 0; i < 21; i++)
        many[i] = 'A';
    EXPECT_DOUBLE_EQ(3.12, percentIdentity(reference, one));
    EXPECT_DOUBLE_EQ(65.62, percentIdentity(reference, many));
}

TEST(roundTo, ties_to_even) {
    EXPECT_DOUBLE_EQ(3.12, roundTo(3.125, 2));
    EXPECT_DOUBLE_EQ(65.62, roundTo(65.625, 2));
    EXPECT_DOUBLE_EQ(0.38, roundTo(0.375, 2));
    EXPECT_DOUBLE_EQ(12.35, roundTo(12.345000001, 2));
    EXPECT_DOUBLE_EQ(12.3, roundTo(12.3449, 2));
    EXPECT_DOUBLE_EQ(100.0, roundTo(99.999, 2));
}

TEST(identityMatrix, diagonal_and_symmetry) {
    const SequenceCollection aligned = collection({
        {"a", "ACGT-ACGTA"},
        {"b", "ACGTTACG-A"},
        {"c", "--GTTTCGCA"},
        {"d", "----------"}
    });
    const Eigen::MatrixXd m = identityMatrix(aligned, aligned.order);
    ASSERT_EQ(4, m.rows());
    ASSERT_EQ(4, m.cols());
    for(long i = 0; i < m.rows(); i++) {
        EXPECT_DOUBLE_EQ(100.0, m(i, i));
        for(long j = 0; j < m.cols(); j++) {
            EXPECT_DOUBLE_EQ(m(i, j), m(j, i));
            EXPECT_GE(m(i, j), 0.0);
            EXPECT_LE(m(i, j), 100.0);
        }
    }
    // All-gap sequence has no overlap with anything, but is identical to itself
    EXPECT_DOUBLE_EQ(0.0, m(0, 3));
    EXPECT_DOUBLE_EQ(100.0, m(3, 3));
}

TEST(identityMatrix, follows_given_order) {
    // Alignment file order differs from input order
    const SequenceCollection aligned = collection({
        {"Z", "AAAA"},
        {"X", "AAAT"},
        {"Y", "AATT"}
    });
    const std::vector<std::string> order {"X", "Y", "Z"};
    const Eigen::MatrixXd m = identityMatrix(aligned, order);
    EXPECT_DOUBLE_EQ(75.0, m(0, 1));   // X vs Y
    EXPECT_DOUBLE_EQ(75.0, m(0, 2));   // X vs Z
    EXPECT_DOUBLE_EQ(50.0, m(1, 2));   // Y vs Z
}

TEST(identityMatrix, scenario_values) {
    const SequenceCollection aligned = collection({{"A", "ACGT"}, {"B", "ACGA"}});
    const Eigen::MatrixXd m = identityMatrix(aligned, aligned.order);
    EXPECT_DOUBLE_EQ(75.0, m(0, 1));
    EXPECT_DOUBLE_EQ(75.0, m(1, 0));
}

TEST(identityMatrix, missing_identifier) {
    const SequenceCollection aligned = collection({{"A", "ACGT"}, {"B", "ACGA"}});
    const std::vector<std::string> order {"A", "B", "C"};
    EXPECT_THROW(identityMatrix(aligned, order), ConsistencyError);
}

TEST(identityMatrix, unequal_lengths) {
    const SequenceCollection aligned = collection({{"A", "ACGT"}, {"B", "ACG"}});
    EXPECT_THROW(identityMatrix(aligned, aligned.order), ConsistencyError);

    const Eigen::MatrixXd m = identityMatrix(aligned, aligned.order, false);
    EXPECT_DOUBLE_EQ(100.0, m(0, 1));
}

TEST(identityMatrix, single_sequence) {
    const SequenceCollection aligned = collection({{"only", "AC-T"}});
    const Eigen::MatrixXd m = identityMatrix(aligned, aligned.order);
    ASSERT_EQ(1, m.rows());
    EXPECT_DOUBLE_EQ(100.0, m(0, 0));
}
