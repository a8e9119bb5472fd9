#include "aligner.hpp"
#include "canvas.hpp"
#include "pairwise_heatmap_config.h"
#include "pipeline.hpp"

#include <boost/program_options.hpp>

#include <cpplog.hpp>

// STL
#include <iostream>
#include <string>
#include <vector>

using namespace pairwise_heatmap;
namespace po = boost::program_options;

cpplog::StdErrLogger logger;

int usage(const po::options_description& desc)
{
    std::cerr << "Usage: pairwise-heatmap [options] --in <input.fasta> --out <output-dir>\n"
              << "       pairwise-heatmap [options] <input.fasta> <output-dir>\n";
    std::cerr << desc << '\n';
    return 1;
}

int main(const int argc, const char** argv)
{
    std::string configPath, mafftPath = "mafft";
    std::vector<std::string> formatNames;
    PipelineOptions options;
    size_t maxIterate = 1000, threads = 0, timeout = 0;
    bool quiet = false, debug = false, noKeepAlignment = false, rejectDuplicates = false, allowUnequal = false;

    // command-line parsing
    po::options_description desc("Allowed options");
    desc.add_options()
    ("help,h", "Produce help message")
    ("version,v", "Show version")
    ("in,i", po::value(&options.inputPath)->required(), "input FASTA file, optionally gzipped [required]")
    ("out,o", po::value(&options.outputDir)->required(), "output directory, created if absent [required]")
    ("config,c", po::value(&configPath), "read further options from an INI-style file")
    ("mafft", po::value(&mafftPath), "MAFFT executable [default: mafft]")
    ("max-iterate", po::value(&maxIterate), "iterative refinement cycles [default: 1000]")
    ("threads", po::value(&threads), "aligner threads; 0 lets MAFFT decide [default: 0]")
    ("timeout", po::value(&timeout), "seconds before the aligner is killed; 0 waits forever [default: 0]")
    ("format,f", po::value(&formatNames)->composing(), "heatmap format(s): pdf, svg [default: pdf svg]")
    ("json", po::bool_switch(&options.writeJson), "also write summary.json")
    ("reject-duplicates", po::bool_switch(&rejectDuplicates), "fail on repeated sequence identifiers")
    ("allow-unequal-lengths", po::bool_switch(&allowUnequal),
     "compare aligned sequences of different lengths over the shorter length")
    ("no-keep-alignment", po::bool_switch(&noKeepAlignment), "*do not* keep all_sequences.aln.fasta")
    ("quiet,q", po::bool_switch(&quiet), "only log warnings and errors")
    ("debug", po::bool_switch(&debug), "log debugging detail");

    po::positional_options_description positional;
    positional.add("in", 1).add("out", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                  options(desc).positional(positional).run(), vm);

        if(vm.count("help")) {
            std::cout << desc << '\n';
            return 0;
        }
        if(vm.count("version")) {
            std::cout << PAIRWISE_HEATMAP_VERSION << '\n';
            return 0;
        }
        if(vm.count("config"))
            po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), desc), vm);

        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << e.what() << "\n\n";
        return usage(desc);
    }

    if(quiet && debug) {
        LOG_FATAL(logger) << "--quiet and --debug are mutually exclusive\n";
        return 1;
    }
    cpplog::FilteringLogger log(debug ? LL_DEBUG : (quiet ? LL_WARN : LL_INFO), &logger);

    if(formatNames.empty())
        formatNames = {"pdf", "svg"};
    options.formats.clear();
    options.keepAlignment = !noKeepAlignment;
    options.duplicates = rejectDuplicates ? DuplicatePolicy::Reject : DuplicatePolicy::Overwrite;
    options.strictLengths = !allowUnequal;

    try {
        for(const std::string& name : formatNames)
            options.formats.push_back(formatForName(name));

        MafftAligner aligner(mafftPath);
        aligner.maxIterate(maxIterate);
        aligner.threads(threads);
        aligner.timeout(timeout);

        const PipelineResult result = runPipeline(options, aligner, log);
        LOG_INFO(log) << "finished: " << result.order.size() << " sequences, "
                      << result.written.size() << " files.\n";
    } catch(const std::exception& e) {
        LOG_ERROR(log) << e.what() << '\n';
        return 1;
    }

    return 0;
}
