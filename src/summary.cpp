#include "summary.hpp"
#include "errors.hpp"
#include "identity_matrix.hpp"
#include "pairwise_heatmap_config.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/format.hpp>
#include <json/json.h>

#include <algorithm>
#include <istream>
#include <ostream>

namespace pairwise_heatmap {

namespace {

std::vector<std::string> splitFields(const std::string& line)
{
    std::string trimmed = line;
    if(!trimmed.empty() && trimmed.back() == '\r')
        trimmed.pop_back();
    std::vector<std::string> fields;
    boost::algorithm::split(fields, trimmed, boost::algorithm::is_any_of("\t"));
    return fields;
}

double parsePercent(const std::string& cell, const size_t row)
{
    if(!boost::algorithm::ends_with(cell, "%"))
        throw MalformedInputError("Row " + std::to_string(row) + ": cell '" + cell + "' is not a percentage");
    try {
        size_t used = 0;
        const double value = std::stod(cell.substr(0, cell.size() - 1), &used);
        if(used != cell.size() - 1)
            throw std::invalid_argument(cell);
        return value;
    } catch(const std::logic_error&) {
        throw MalformedInputError("Row " + std::to_string(row) + ": cell '" + cell + "' is not a percentage");
    }
}

}

void writeSummary(std::ostream& out, const Eigen::MatrixXd& matrix, const std::vector<std::string>& order)
{
    for(const std::string& id : order)
        out << '\t' << id;
    out << '\n';
    for(size_t i = 0; i < order.size(); i++) {
        out << order[i];
        for(size_t j = 0; j < order.size(); j++)
            out << '\t' << boost::format("%.1f%%") % matrix(i, j);
        out << '\n';
    }
}

Summary readSummary(std::istream& in)
{
    Summary result;
    std::string line;
    if(!std::getline(in, line))
        throw MalformedInputError("Empty summary table");

    std::vector<std::string> header = splitFields(line);
    if(header.size() < 2 || !header[0].empty())
        throw MalformedInputError("Summary header must start with an empty field");
    result.order.assign(header.begin() + 1, header.end());

    const size_t n = result.order.size();
    result.identity.resize(n, n);
    size_t row = 0;
    while(std::getline(in, line)) {
        if(line.empty())
            continue;
        const std::vector<std::string> fields = splitFields(line);
        if(row >= n || fields.size() != n + 1 || fields[0] != result.order[row])
            throw MalformedInputError("Summary row " + std::to_string(row + 1) + " does not match the header");
        for(size_t j = 0; j < n; j++)
            result.identity(row, j) = parsePercent(fields[j + 1], row + 1);
        row++;
    }
    if(row != n)
        throw MalformedInputError("Summary has " + std::to_string(row) + " rows for " + std::to_string(n) + " columns");
    return result;
}

void writeJsonSummary(std::ostream& out, const Eigen::MatrixXd& matrix, const std::vector<std::string>& order)
{
    Json::Value root;
    root["version"] = PAIRWISE_HEATMAP_VERSION;

    Json::Value ids(Json::arrayValue);
    for(const std::string& id : order)
        ids.append(id);
    root["identifiers"] = ids;

    Json::Value rows(Json::arrayValue);
    double sum = 0, minimum = 100;
    size_t count = 0;
    for(size_t i = 0; i < order.size(); i++) {
        Json::Value row(Json::arrayValue);
        for(size_t j = 0; j < order.size(); j++) {
            row.append(roundTo(matrix(i, j), 2));
            if(i != j) {
                sum += matrix(i, j);
                minimum = std::min(minimum, matrix(i, j));
                count++;
            }
        }
        rows.append(row);
    }
    root["identity"] = rows;

    if(count > 0) {
        root["minimumIdentity"] = minimum;
        root["meanIdentity"] = roundTo(sum / count, 2);
    } else {
        root["minimumIdentity"] = Json::Value(Json::nullValue);
        root["meanIdentity"] = Json::Value(Json::nullValue);
    }

    out << root << '\n';
}

}
