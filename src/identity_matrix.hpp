#ifndef PAIRWISE_HEATMAP_IDENTITY_MATRIX_H
#define PAIRWISE_HEATMAP_IDENTITY_MATRIX_H

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace pairwise_heatmap {

struct SequenceCollection;

const char GAP = '-';

/// Column counts for one pair of aligned sequences
struct PairIdentity {
    /// Columns where both residues are present and equal
    size_t matches;
    /// Columns where neither sequence has a gap
    size_t overlap;

    /// 100 * matches / overlap, rounded to two decimals; 0 when there is no overlap
    double percent() const;
};

/// Round to a fixed number of decimal places, ties to even
double roundTo(const double value, const int digits);

/// \brief Count matching and overlapping columns of two aligned sequences.
///
/// Comparison stops at the end of the shorter sequence.
PairIdentity comparePair(const std::string& a, const std::string& b);

inline double percentIdentity(const std::string& a, const std::string& b)
{
    return comparePair(a, b).percent();
}

/// \brief Build the percent-identity matrix over \c order.
///
/// Row and column i correspond to order[i]. The diagonal is exactly 100.
///
/// \param strictLengths Require all aligned sequences to have the same length
/// \throws ConsistencyError if an identifier in order is absent from aligned,
/// or if strictLengths is set and lengths differ. Raised before any cell is computed.
Eigen::MatrixXd identityMatrix(const SequenceCollection& aligned,
                               const std::vector<std::string>& order,
                               const bool strictLengths = true);

}

#endif
