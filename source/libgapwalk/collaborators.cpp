#include "collaborators.h"
#include "gap_errors.h"

#include <algorithm>

namespace gapwalk {

std::string VariantCaller::apply(const SequenceBuffer& reference, const std::vector<Variant>& variants) {
    return applyVariants(reference.sequence(), variants);
}

std::string applyVariants(const std::string& sequence, const std::vector<Variant>& variants,
                          VariantApplyStats* stats) {
    std::vector<Variant> ordered(variants);
    std::sort(ordered.begin(), ordered.end(), [](const Variant& a, const Variant& b) {
        return a.pos > b.pos;
    });

    std::string out(sequence);
    VariantApplyStats local;
    uint64_t lastStart = static_cast<uint64_t>(-1); // 1-based start of the last applied variant
    for (const auto& v : ordered) {
        if (v.pos == 0 || v.ref.empty() || v.pos - 1 + v.ref.size() > out.size()
            || v.pos - 1 + v.ref.size() > lastStart - 1) {
            ++local.skipped;
            continue;
        }
        std::string current = out.substr(v.pos - 1, v.ref.size());
        if (toUpperCopy(current) != toUpperCopy(v.ref)) {
            ++local.skipped;
            continue;
        }
        out.replace(v.pos - 1, v.ref.size(), v.alt);
        lastStart = v.pos;
        ++local.applied;
    }
    if (stats) *stats = local;
    return out;
}

void Collaborators::requireAll() const {
    if (!aligner) throw ConfigurationError("no read aligner configured");
    if (!refiner) throw ConfigurationError("no alignment refiner configured");
    if (!downsampler) throw ConfigurationError("no alignment downsampler configured");
    if (!depth) throw ConfigurationError("no depth reporter configured");
    if (!phaser) throw ConfigurationError("no read phaser configured");
    if (!msa) throw ConfigurationError("no multiple-sequence aligner configured");
    if (!variantCaller) throw ConfigurationError("no variant caller configured");
}

} // namespace gapwalk
