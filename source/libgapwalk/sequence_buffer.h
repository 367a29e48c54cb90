#ifndef GAPWALK_SEQUENCE_BUFFER_H
#define GAPWALK_SEQUENCE_BUFFER_H

#include <cstddef>
#include <string>

namespace gapwalk {

// Reference sequence value: an identifier and a nucleotide string.
// Never modified in place; replace() returns a new buffer.
class SequenceBuffer {
public:
    SequenceBuffer() {}
    SequenceBuffer(const std::string& id, const std::string& sequence);

    const std::string& id() const { return id_; }
    const std::string& sequence() const { return sequence_; }
    size_t length() const { return sequence_.size(); }

    // First run of exactly GAP_RUN_LENGTH N/n, left to right.
    // Longer or shorter runs of N are not gap markers.
    bool gapRun(size_t& start) const;
    size_t gapRunCount() const;

    // Case-insensitive, non-overlapping linear scan
    size_t countOccurrences(const std::string& pattern) const;

    // New buffer with the first case-insensitive occurrence of oldSub replaced.
    // Throws SequenceNotFound when oldSub does not occur.
    SequenceBuffer replace(const std::string& oldSub, const std::string& newSub) const;

    // Substring clipped to the sequence bounds; start may be negative
    std::string slice(long long start, size_t length) const;

    bool operator==(const SequenceBuffer& other) const {
        return id_ == other.id_ && sequence_ == other.sequence_;
    }
    bool operator!=(const SequenceBuffer& other) const { return !(*this == other); }

private:
    std::string id_;
    std::string sequence_;
};

// Case-insensitive find, npos when absent
size_t findNoCase(const std::string& haystack, const std::string& needle, size_t from = 0);
size_t rfindNoCase(const std::string& haystack, const std::string& needle);

std::string toLowerCopy(const std::string& s);
std::string toUpperCopy(const std::string& s);

} // namespace gapwalk

#endif // GAPWALK_SEQUENCE_BUFFER_H
