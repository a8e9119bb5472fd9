#include "pipeline.hpp"
#include "aligner.hpp"
#include "errors.hpp"
#include "heatmap.hpp"
#include "identity_matrix.hpp"
#include "summary.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include <cpplog.hpp>

#include <fstream>
#include <memory>

namespace fs = boost::filesystem;

namespace pairwise_heatmap {

namespace {

/// Removes the file on destruction unless released
struct ScratchFile {
    explicit ScratchFile(const fs::path& path) : path(path) {}
    ~ScratchFile()
    {
        if(!path.empty()) {
            boost::system::error_code ec;
            fs::remove(path, ec);
        }
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    fs::path release()
    {
        fs::path result = path;
        path.clear();
        return result;
    }

    fs::path path;
};

/// Removes every registered output unless the run completes
struct OutputGuard {
    ~OutputGuard()
    {
        if(committed)
            return;
        for(const std::string& p : files) {
            boost::system::error_code ec;
            fs::remove(p, ec);
        }
    }

    bool committed = false;
    std::vector<std::string> files;
};

void writeTextFile(const std::string& path, OutputGuard& guard,
                   void (*writer)(std::ostream&, const Eigen::MatrixXd&, const std::vector<std::string>&),
                   const Eigen::MatrixXd& matrix, const std::vector<std::string>& order)
{
    guard.files.push_back(path);
    std::ofstream out(path, std::ios::out | std::ios::binary);
    if(!out)
        throw ReportError("Cannot open " + path + " for writing");
    writer(out, matrix, order);
    out.close();
    if(!out)
        throw ReportError("Failed writing " + path);
}

}

PipelineResult runPipeline(const PipelineOptions& options, Aligner& aligner, cpplog::BaseLogger& log)
{
    const fs::path outputDir(options.outputDir);

    LOG_INFO(log) << "Loading sequences from " << options.inputPath << '\n';
    const SequenceCollection input = loadSequences(options.inputPath, options.duplicates);
    LOG_INFO(log) << input.size() << " sequences.\n";
    for(const std::string& id : input.duplicates)
        LOG_WARN(log) << "Duplicate identifier '" << id << "': keeping the last record at its first position\n";

    boost::system::error_code ec;
    fs::create_directories(outputDir, ec);
    if(ec)
        throw ReportError("Cannot create " + outputDir.string() + ": " + ec.message());

    // The aligner reads plain FASTA; decompress if necessary
    std::unique_ptr<ScratchFile> staged;
    std::string alignerInput = options.inputPath;
    if(boost::algorithm::ends_with(options.inputPath, ".gz")) {
        staged.reset(new ScratchFile(outputDir / fs::unique_path("input-%%%%-%%%%.fasta")));
        std::ofstream out(staged->path.string());
        writeSequences(out, input);
        out.close();
        if(!out)
            throw ReportError("Failed writing " + staged->path.string());
        alignerInput = staged->path.string();
    }

    ScratchFile alignment(outputDir / fs::unique_path("all_sequences-%%%%-%%%%.aln.tmp"));
    LOG_INFO(log) << "Aligning: " << aligner.describe() << '\n';
    aligner.align(alignerInput, alignment.path.string());

    const SequenceCollection aligned = loadSequences(alignment.path.string());
    if(aligned.size() != input.size())
        LOG_WARN(log) << "Alignment has " << aligned.size() << " records; input has " << input.size() << '\n';

    PipelineResult result;
    result.order = input.order;
    result.identity = identityMatrix(aligned, input.order, options.strictLengths);
    LOG_INFO(log) << "Computed " << result.identity.rows() << 'x' << result.identity.cols() << " identity matrix\n";

    OutputGuard guard;
    if(options.keepAlignment) {
        const fs::path kept = outputDir / ALIGNMENT_FILE;
        fs::rename(alignment.path, kept, ec);
        if(ec)
            throw ReportError("Cannot move alignment to " + kept.string() + ": " + ec.message());
        alignment.release();
        guard.files.push_back(kept.string());
    }

    writeTextFile((outputDir / SUMMARY_FILE).string(), guard, writeSummary, result.identity, result.order);
    if(options.writeJson)
        writeTextFile((outputDir / JSON_SUMMARY_FILE).string(), guard, writeJsonSummary, result.identity, result.order);

    // Register images up front so a failure part way through removes those already written
    const size_t nText = guard.files.size();
    for(const ImageFormat format : options.formats)
        guard.files.push_back((outputDir / ("heatmap." + extension(format))).string());
    const std::vector<std::string> images = writeHeatmaps(result.identity, result.order, options.outputDir,
                                                          options.formats);

    result.written.assign(guard.files.begin(), guard.files.begin() + nText);
    result.written.insert(result.written.end(), images.begin(), images.end());
    guard.committed = true;
    for(const std::string& p : result.written)
        LOG_INFO(log) << "Wrote " << p << '\n';
    return result;
}

}
