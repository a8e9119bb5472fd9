#ifndef PAIRWISE_HEATMAP_PIPELINE_H
#define PAIRWISE_HEATMAP_PIPELINE_H

#include "canvas.hpp"
#include "sequence_store.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace cpplog {
class BaseLogger;
}

namespace pairwise_heatmap {

class Aligner;

const char ALIGNMENT_FILE[] = "all_sequences.aln.fasta";
const char SUMMARY_FILE[] = "summary.txt";
const char JSON_SUMMARY_FILE[] = "summary.json";

struct PipelineOptions {
    std::string inputPath;
    /// Created if absent
    std::string outputDir;
    std::vector<ImageFormat> formats {ImageFormat::PDF, ImageFormat::SVG};
    bool writeJson = false;
    /// Keep the aligner's output as ALIGNMENT_FILE
    bool keepAlignment = true;
    DuplicatePolicy duplicates = DuplicatePolicy::Overwrite;
    /// Require aligned sequences to share one length
    bool strictLengths = true;
};

struct PipelineResult {
    /// Identifiers in input order; rows and columns of identity
    std::vector<std::string> order;
    Eigen::MatrixXd identity;
    /// Output files, in the order written
    std::vector<std::string> written;
};

/// \brief Align the input, compute pairwise identity and write the reports.
///
/// Any failure before the reports are complete removes the files this run
/// created and rethrows; nothing is retried.
///
/// \throws MalformedInputError, AlignmentError, ConsistencyError, ReportError
PipelineResult runPipeline(const PipelineOptions& options, Aligner& aligner, cpplog::BaseLogger& log);

}

#endif
