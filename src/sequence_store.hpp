#ifndef PAIRWISE_HEATMAP_SEQUENCE_STORE_H
#define PAIRWISE_HEATMAP_SEQUENCE_STORE_H

#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairwise_heatmap {

enum class DuplicatePolicy {
    /// Later records replace earlier ones; the identifier keeps its first position
    Overwrite,
    /// Raise MalformedInputError on the second occurrence
    Reject
};

struct SequenceCollection {
    /// Identifier -> upper-cased residues
    std::unordered_map<std::string, std::string> sequences;
    /// Identifiers in order of first appearance
    std::vector<std::string> order;
    /// Identifiers seen more than once, in order of the repeat
    std::vector<std::string> duplicates;

    size_t size() const { return order.size(); }
    const std::string& at(const std::string& id) const { return sequences.at(id); }
};

/// \brief Parse FASTA records from a stream.
///
/// A header is a line whose first character is '>'; an indented '>' is
/// sequence data. The identifier is the complete header line after '>', with
/// surrounding whitespace removed. Sequence lines are concatenated and upper-cased;
/// blank lines are skipped.
///
/// \param sourceName Used in error messages only
/// \throws MalformedInputError on sequence data before the first header,
/// an empty identifier, no records at all, or a duplicate under DuplicatePolicy::Reject
SequenceCollection loadSequences(std::istream& in,
                                 const DuplicatePolicy policy = DuplicatePolicy::Overwrite,
                                 const std::string& sourceName = "<stream>");

/// Parse a FASTA file; paths ending in ".gz" are decompressed.
SequenceCollection loadSequences(const std::string& path,
                                 const DuplicatePolicy policy = DuplicatePolicy::Overwrite);

/// Write records in canonical order, wrapping residues at lineWidth (0: no wrapping)
void writeSequences(std::ostream& out, const SequenceCollection& collection, const size_t lineWidth = 60);

}

#endif
