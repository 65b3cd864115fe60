#include <algorithm>

#include "rnm/target/skip_set.hpp"

namespace rnm {

SkipSet::SkipSet(const std::vector<Target>& targets) {
    for (const auto& t : targets)
        add(t);
}

SkipSet::SkipSet(std::initializer_list<Target> targets) {
    for (const auto& t : targets)
        add(t);
}

void SkipSet::add(const Target& t) {
    if (!t.isLocal()) {
        throw InvalidAddressError(
          "skip target must be local (no instance path): " + t.toString());
    }
    mTargets.insert(t);
}

std::vector<Target> SkipSet::sorted() const {
    std::vector<Target> out(mTargets.begin(), mTargets.end());
    std::sort(out.begin(), out.end(), [](const Target& a, const Target& b) {
        return a.toString() < b.toString();
    });
    return out;
}
} // namespace rnm
