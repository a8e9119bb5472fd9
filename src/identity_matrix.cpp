#include "identity_matrix.hpp"
#include "errors.hpp"
#include "sequence_store.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace pairwise_heatmap {

double PairIdentity::percent() const
{
    if(overlap == 0)
        return 0.0;
    return roundTo(100.0 * matches / overlap, 2);
}

double roundTo(const double value, const int digits)
{
    const double scale = std::pow(10.0, digits);
    // Ties go to the even neighbour under the default rounding mode
    return std::nearbyint(value * scale) / scale;
}

PairIdentity comparePair(const std::string& a, const std::string& b)
{
    PairIdentity result {0, 0};
    const size_t n = std::min(a.size(), b.size());
    for(size_t i = 0; i < n; i++) {
        if(a[i] == GAP || b[i] == GAP)
            continue;
        result.overlap++;
        if(a[i] == b[i])
            result.matches++;
    }
    return result;
}

Eigen::MatrixXd identityMatrix(const SequenceCollection& aligned,
                               const std::vector<std::string>& order,
                               const bool strictLengths)
{
    // Resolve every row first so a missing record fails before any work
    std::vector<const std::string*> rows;
    rows.reserve(order.size());
    for(const std::string& id : order) {
        auto it = aligned.sequences.find(id);
        if(it == aligned.sequences.end())
            throw ConsistencyError("Sequence '" + id + "' is missing from the alignment");
        rows.push_back(&it->second);
    }

    if(strictLengths) {
        for(size_t i = 1; i < rows.size(); i++) {
            if(rows[i]->size() != rows[0]->size()) {
                std::ostringstream msg;
                msg << "Aligned length of '" << order[i] << "' (" << rows[i]->size()
                    << ") differs from '" << order[0] << "' (" << rows[0]->size() << ")";
                throw ConsistencyError(msg.str());
            }
        }
    }

    const size_t n = rows.size();
    Eigen::MatrixXd result(n, n);
    for(size_t i = 0; i < n; i++) {
        for(size_t j = 0; j < n; j++) {
            if(i == j)
                result(i, j) = 100.0;
            else
                result(i, j) = percentIdentity(*rows[i], *rows[j]);
        }
    }
    return result;
}

}
