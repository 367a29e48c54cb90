#include "sequence_buffer.h"
#include "gap_constants.h"
#include "gap_errors.h"

#include <algorithm>
#include <cctype>

namespace gapwalk {

namespace {

inline bool isN(char c) {
    return c == 'N' || c == 'n';
}

inline bool equalNoCase(char a, char b) {
    return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
}

} // namespace

size_t findNoCase(const std::string& haystack, const std::string& needle, size_t from) {
    if (needle.empty() || from > haystack.size() || needle.size() > haystack.size() - from) {
        return std::string::npos;
    }
    std::string::const_iterator it = std::search(haystack.begin() + from, haystack.end(),
                                                 needle.begin(), needle.end(), equalNoCase);
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(it - haystack.begin());
}

size_t rfindNoCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty() || needle.size() > haystack.size()) {
        return std::string::npos;
    }
    std::string::const_iterator it = std::find_end(haystack.begin(), haystack.end(),
                                                   needle.begin(), needle.end(), equalNoCase);
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<size_t>(it - haystack.begin());
}

std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string toUpperCopy(const std::string& s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

SequenceBuffer::SequenceBuffer(const std::string& id, const std::string& sequence)
    : id_(id), sequence_(sequence) {}

bool SequenceBuffer::gapRun(size_t& start) const {
    size_t i = 0;
    while (i < sequence_.size()) {
        if (!isN(sequence_[i])) {
            ++i;
            continue;
        }
        size_t runStart = i;
        while (i < sequence_.size() && isN(sequence_[i])) ++i;
        if (i - runStart == GAP_RUN_LENGTH) {
            start = runStart;
            return true;
        }
    }
    return false;
}

size_t SequenceBuffer::gapRunCount() const {
    size_t count = 0;
    size_t i = 0;
    while (i < sequence_.size()) {
        if (!isN(sequence_[i])) {
            ++i;
            continue;
        }
        size_t runStart = i;
        while (i < sequence_.size() && isN(sequence_[i])) ++i;
        if (i - runStart == GAP_RUN_LENGTH) ++count;
    }
    return count;
}

size_t SequenceBuffer::countOccurrences(const std::string& pattern) const {
    if (pattern.empty()) return 0;
    size_t count = 0;
    size_t pos = findNoCase(sequence_, pattern, 0);
    while (pos != std::string::npos) {
        ++count;
        pos = findNoCase(sequence_, pattern, pos + pattern.size());
    }
    return count;
}

SequenceBuffer SequenceBuffer::replace(const std::string& oldSub, const std::string& newSub) const {
    size_t pos = findNoCase(sequence_, oldSub, 0);
    if (pos == std::string::npos) {
        throw SequenceNotFound("sequence " + id_ + " does not contain " + oldSub);
    }
    std::string updated;
    updated.reserve(sequence_.size() - oldSub.size() + newSub.size());
    updated.append(sequence_, 0, pos);
    updated.append(newSub);
    updated.append(sequence_, pos + oldSub.size(), std::string::npos);
    return SequenceBuffer(id_, updated);
}

std::string SequenceBuffer::slice(long long start, size_t length) const {
    long long end = start + static_cast<long long>(length);
    long long len = static_cast<long long>(sequence_.size());
    if (start < 0) start = 0;
    if (end > len) end = len;
    if (start >= end) return std::string();
    return sequence_.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

} // namespace gapwalk
