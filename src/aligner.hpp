#ifndef PAIRWISE_HEATMAP_ALIGNER_H
#define PAIRWISE_HEATMAP_ALIGNER_H

#include <string>
#include <vector>

namespace pairwise_heatmap {

/// Produces a multiple sequence alignment of a FASTA file
class Aligner
{
public:
    virtual ~Aligner() {}

    /// \brief Align every sequence in inputPath, writing aligned FASTA to outputPath.
    /// \throws AlignmentError on failure
    virtual void align(const std::string& inputPath, const std::string& outputPath) = 0;

    /// Human-readable description, for logging
    virtual std::string describe() const = 0;
};

/// Runs MAFFT (E-INS-i style: --genafpair with iterative refinement) as a child process
class MafftAligner : public Aligner
{
public:
    /// Executable name (searched on PATH) or path
    const std::string& executable() const { return executable_; }
    void executable(const std::string& value) { executable_ = value; }
    /// Iterative refinement cycles
    size_t maxIterate() const { return maxIterate_; }
    void maxIterate(const size_t value) { maxIterate_ = value; }
    /// Threads; 0 leaves the choice to MAFFT
    size_t threads() const { return threads_; }
    void threads(const size_t value) { threads_ = value; }
    /// Seconds to wait before killing the aligner; 0 waits forever
    size_t timeout() const { return timeout_; }
    void timeout(const size_t value) { timeout_ = value; }

    explicit MafftAligner(const std::string& executable = "mafft");

    void align(const std::string& inputPath, const std::string& outputPath) override;
    std::string describe() const override;

    /// Command-line arguments (excluding the executable) for aligning inputPath
    std::vector<std::string> arguments(const std::string& inputPath) const;
private:
    std::string executable_;
    size_t maxIterate_, threads_, timeout_;
};

}

#endif
