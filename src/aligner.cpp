#include "aligner.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <chrono>
#include <deque>
#include <fstream>
#include <sstream>

namespace bp = boost::process;
namespace fs = boost::filesystem;

namespace pairwise_heatmap {

namespace {

/// Last few lines of the aligner's stderr, for error messages
std::string tail(const fs::path& path, const size_t nLines = 5)
{
    std::ifstream in(path.string());
    std::deque<std::string> lines;
    std::string line;
    while(std::getline(in, line)) {
        if(line.empty())
            continue;
        lines.push_back(line);
        if(lines.size() > nLines)
            lines.pop_front();
    }
    std::ostringstream s;
    for(const std::string& l : lines)
        s << "\n  " << l;
    return s.str();
}

fs::path resolveExecutable(const std::string& name)
{
    if(name.find('/') != std::string::npos)
        return fs::path(name);
    return bp::search_path(name);
}

}

MafftAligner::MafftAligner(const std::string& executable) :
    executable_(executable),
    maxIterate_(1000),
    threads_(0),
    timeout_(0)
{
}

std::vector<std::string> MafftAligner::arguments(const std::string& inputPath) const
{
    std::vector<std::string> args {"--maxiterate", std::to_string(maxIterate_), "--genafpair"};
    if(threads_ > 0) {
        args.push_back("--thread");
        args.push_back(std::to_string(threads_));
    }
    args.push_back("--quiet");
    args.push_back(inputPath);
    return args;
}

std::string MafftAligner::describe() const
{
    return executable_ + " " + boost::algorithm::join(arguments("<input>"), " ");
}

void MafftAligner::align(const std::string& inputPath, const std::string& outputPath)
{
    const fs::path exe = resolveExecutable(executable_);
    if(exe.empty() || !fs::exists(exe))
        throw AlignmentError("Aligner executable not found: " + executable_);

    const fs::path errPath = fs::path(outputPath).string() + ".stderr";
    int exitCode = 0;
    try {
        bp::child c(exe, bp::args(arguments(inputPath)),
                    bp::std_in < bp::null,
                    bp::std_out > outputPath,
                    bp::std_err > errPath.string());
        if(timeout_ > 0) {
            if(!c.wait_for(std::chrono::seconds(timeout_))) {
                c.terminate();
                boost::system::error_code ec;
                fs::remove(errPath, ec);
                throw AlignmentError(executable_ + " did not finish within " + std::to_string(timeout_) + " seconds");
            }
        } else {
            c.wait();
        }
        exitCode = c.exit_code();
    } catch(const bp::process_error& e) {
        boost::system::error_code ec;
        fs::remove(errPath, ec);
        throw AlignmentError("Failed to run " + executable_ + ": " + e.what());
    }

    const std::string messages = tail(errPath);
    boost::system::error_code ec;
    fs::remove(errPath, ec);

    if(exitCode != 0)
        throw AlignmentError(executable_ + " exited with status " + std::to_string(exitCode) + messages);
    if(!fs::exists(outputPath) || fs::file_size(outputPath) == 0)
        throw AlignmentError(executable_ + " produced no alignment" + messages);
}

}
