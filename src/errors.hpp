#ifndef PAIRWISE_HEATMAP_ERRORS_H
#define PAIRWISE_HEATMAP_ERRORS_H

#include <stdexcept>
#include <string>

namespace pairwise_heatmap {

/// Input FASTA could not be read, or is not structured as FASTA
struct MalformedInputError : public std::runtime_error {
    explicit MalformedInputError(const std::string& what) : std::runtime_error(what) {}
};

/// The external aligner failed to produce an alignment
struct AlignmentError : public std::runtime_error {
    explicit AlignmentError(const std::string& what) : std::runtime_error(what) {}
};

/// Aligned sequences do not match the input they were built from
struct ConsistencyError : public std::runtime_error {
    explicit ConsistencyError(const std::string& what) : std::runtime_error(what) {}
};

/// An output file could not be produced
struct ReportError : public std::runtime_error {
    explicit ReportError(const std::string& what) : std::runtime_error(what) {}
};

}

#endif
