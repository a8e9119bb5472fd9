#ifndef PAIRWISE_HEATMAP_SUMMARY_H
#define PAIRWISE_HEATMAP_SUMMARY_H

#include <Eigen/Dense>

#include <iosfwd>
#include <string>
#include <vector>

namespace pairwise_heatmap {

struct Summary {
    std::vector<std::string> order;
    Eigen::MatrixXd identity;
};

/// \brief Tab-separated table: a header of "" and the identifiers, then one
/// row per identifier with cells formatted as "<value>%" to one decimal.
void writeSummary(std::ostream& out, const Eigen::MatrixXd& matrix, const std::vector<std::string>& order);

/// \brief Parse a table written by writeSummary.
/// \throws MalformedInputError if the table is not square or a cell is not a percentage
Summary readSummary(std::istream& in);

/// JSON document with identifiers, the identity matrix and off-diagonal statistics
void writeJsonSummary(std::ostream& out, const Eigen::MatrixXd& matrix, const std::vector<std::string>& order);

}

#endif
