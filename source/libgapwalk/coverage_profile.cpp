#include "coverage_profile.h"
#include "gap_constants.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace gapwalk {

void CoverageProfile::add(uint64_t pos1, double depth) {
    if (depth <= 0.0 || pos1 == 0) return;
    std::map<uint64_t, double>::iterator it = depth_.find(pos1);
    if (it != depth_.end()) {
        total_ -= it->second;
        it->second = depth;
    } else {
        depth_[pos1] = depth;
    }
    total_ += depth;
}

double CoverageProfile::depthAt(uint64_t pos1) const {
    std::map<uint64_t, double>::const_iterator it = depth_.find(pos1);
    return it == depth_.end() ? 0.0 : it->second;
}

double CoverageProfile::meanCoverage() const {
    if (depth_.empty()) return 0.0;
    return total_ / static_cast<double>(depth_.size());
}

uint64_t CoverageProfile::lastPosition() const {
    return depth_.empty() ? 0 : depth_.rbegin()->first;
}

CoverageProfile CoverageProfile::fromDepthFile(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in.good()) {
        throw std::runtime_error("Cannot open depth file: " + path);
    }
    CoverageProfile profile;
    std::string line;
    size_t lineNum = 0;
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.empty() || line[0] == '#') continue;
        std::istringstream iss(line);
        std::string contig;
        uint64_t pos = 0;
        double depth = 0.0;
        if (!(iss >> contig >> pos >> depth)) {
            throw std::runtime_error("Malformed depth line " + std::to_string(lineNum) + " in " + path);
        }
        profile.add(pos, depth);
    }
    return profile;
}

std::string maskLowCoverage(const std::string& sequence, const CoverageProfile& profile, double fraction) {
    std::string masked(sequence);
    const double threshold = fraction * profile.meanCoverage();
    uint64_t last = profile.lastPosition();
    if (last > masked.size()) last = masked.size();

    for (uint64_t pos1 = 1; pos1 <= last; ++pos1) {
        if (!profile.has(pos1) || profile.depthAt(pos1) <= threshold) {
            masked[pos1 - 1] = MASK_BASE;
        }
    }
    return masked;
}

} // namespace gapwalk
