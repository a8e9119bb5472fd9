#include <chrono>
#include <string>
#include <vector>
#include "gtest/gtest.h"
#include "aligner.hpp"
#include "errors.hpp"
#include "temporary_directory.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

using namespace pairwise_heatmap;
namespace fs = boost::filesystem;

/// Write an executable shell script standing in for the aligner
std::string script(const TemporaryDirectory& dir, const std::string& name, const std::string& body)
{
    const std::string path = dir.write(name, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::owner_all);
    return path;
}

TEST(MafftAligner, arguments) {
    MafftAligner aligner;
    EXPECT_EQ("mafft", aligner.executable());
    std::vector<std::string> expected {"--maxiterate", "1000", "--genafpair", "--quiet", "in.fa"};
    EXPECT_EQ(expected, aligner.arguments("in.fa"));

    aligner.maxIterate(16);
    aligner.threads(4);
    expected = {"--maxiterate", "16", "--genafpair", "--thread", "4", "--quiet", "in.fa"};
    EXPECT_EQ(expected, aligner.arguments("in.fa"));
    EXPECT_EQ("mafft --maxiterate 16 --genafpair --thread 4 --quiet <input>", aligner.describe());
}

TEST(MafftAligner, passes_input_and_captures_output) {
    TemporaryDirectory dir;
    const std::string exe = script(dir, "fake-mafft",
                                   "for last in \"$@\"; do :; done\n"
                                   "echo \"$@\" > \"$0.args\"\n"
                                   "cat \"$last\"\n");
    const std::string input = dir.write("in.fasta", ">a\nAC-T\n>b\n-CGT\n");
    const std::string output = dir.file("out.fasta");

    MafftAligner aligner(exe);
    aligner.align(input, output);

    EXPECT_EQ(">a\nAC-T\n>b\n-CGT\n", readFile(output));
    EXPECT_EQ("--maxiterate 1000 --genafpair --quiet " + input + "\n", readFile(exe + ".args"));
    // stderr capture is cleaned up
    EXPECT_FALSE(fs::exists(output + ".stderr"));
}

TEST(MafftAligner, nonzero_exit) {
    TemporaryDirectory dir;
    const std::string input = dir.write("in.fasta", ">a\nACGT\n");

    MafftAligner failing("false");
    EXPECT_THROW(failing.align(input, dir.file("out.fasta")), AlignmentError);

    const std::string exe = script(dir, "broken-mafft", "echo 'unrecognized sequence' >&2\nexit 3\n");
    MafftAligner broken(exe);
    try {
        broken.align(input, dir.file("out2.fasta"));
        FAIL() << "expected AlignmentError";
    } catch(const AlignmentError& e) {
        const std::string what = e.what();
        EXPECT_TRUE(boost::algorithm::contains(what, "status 3")) << what;
        EXPECT_TRUE(boost::algorithm::contains(what, "unrecognized sequence")) << what;
    }
}

TEST(MafftAligner, missing_executable) {
    TemporaryDirectory dir;
    const std::string input = dir.write("in.fasta", ">a\nACGT\n");
    MafftAligner byName("pairwise-heatmap-no-such-aligner");
    EXPECT_THROW(byName.align(input, dir.file("out.fasta")), AlignmentError);
    MafftAligner byPath(dir.file("absent/mafft"));
    EXPECT_THROW(byPath.align(input, dir.file("out.fasta")), AlignmentError);
}

TEST(MafftAligner, empty_output) {
    TemporaryDirectory dir;
    const std::string input = dir.write("in.fasta", ">a\nACGT\n");
    MafftAligner silent(script(dir, "silent-mafft", "exit 0\n"));
    EXPECT_THROW(silent.align(input, dir.file("out.fasta")), AlignmentError);
}

TEST(MafftAligner, timeout) {
    TemporaryDirectory dir;
    const std::string input = dir.write("in.fasta", ">a\nACGT\n");
    MafftAligner slow(script(dir, "slow-mafft", "exec sleep 30\n"));
    slow.timeout(1);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(slow.align(input, dir.file("out.fasta")), AlignmentError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(20));
}
