#include "sequence_store.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>

namespace pairwise_heatmap {

namespace {

void finishRecord(SequenceCollection& result, const std::string& id, std::string& residues)
{
    boost::algorithm::to_upper(residues);
    result.sequences[id] = residues;
    residues.clear();
}

std::string location(const std::string& sourceName, const size_t lineNumber)
{
    std::ostringstream s;
    s << sourceName << ':' << lineNumber;
    return s.str();
}

}

SequenceCollection loadSequences(std::istream& in,
                                 const DuplicatePolicy policy,
                                 const std::string& sourceName)
{
    SequenceCollection result;
    std::string line, id, residues;
    bool inRecord = false;
    size_t lineNumber = 0;

    while(std::getline(in, line)) {
        lineNumber++;
        boost::algorithm::trim_right(line);
        if(boost::algorithm::all(line, boost::algorithm::is_space()))
            continue;

        if(line[0] == '>') {
            if(inRecord)
                finishRecord(result, id, residues);

            id = boost::algorithm::trim_copy(line.substr(1));
            if(id.empty())
                throw MalformedInputError(location(sourceName, lineNumber) + ": empty sequence identifier");

            if(result.sequences.count(id)) {
                if(policy == DuplicatePolicy::Reject)
                    throw MalformedInputError(location(sourceName, lineNumber) + ": duplicate sequence identifier '" + id + "'");
                result.duplicates.push_back(id);
            } else {
                result.order.push_back(id);
                // Reserve the slot so a header with no residues still yields a record
                result.sequences[id] = std::string();
            }
            inRecord = true;
        } else {
            if(!inRecord)
                throw MalformedInputError(location(sourceName, lineNumber) + ": sequence data before first header");
            residues += boost::algorithm::trim_left_copy(line);
        }
    }

    if(in.bad())
        throw MalformedInputError(sourceName + ": read error");
    if(inRecord)
        finishRecord(result, id, residues);
    if(result.order.empty())
        throw MalformedInputError(sourceName + ": no FASTA records");

    return result;
}

SequenceCollection loadSequences(const std::string& path, const DuplicatePolicy policy)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if(!file)
        throw MalformedInputError("Cannot open " + path);

    boost::iostreams::filtering_streambuf<boost::iostreams::input> inBuf;
    if(boost::algorithm::ends_with(path, ".gz"))
        inBuf.push(boost::iostreams::gzip_decompressor());
    inBuf.push(file);
    std::istream inStream(&inBuf);

    try {
        return loadSequences(inStream, policy, path);
    } catch(const boost::iostreams::gzip_error& e) {
        throw MalformedInputError(path + ": " + e.what());
    }
}

void writeSequences(std::ostream& out, const SequenceCollection& collection, const size_t lineWidth)
{
    for(const std::string& id : collection.order) {
        out << '>' << id << '\n';
        const std::string& residues = collection.at(id);
        if(lineWidth == 0) {
            out << residues << '\n';
            continue;
        }
        for(size_t i = 0; i < residues.size(); i += lineWidth)
            out << residues.substr(i, lineWidth) << '\n';
    }
}

}
