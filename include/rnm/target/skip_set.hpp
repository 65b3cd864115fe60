#pragma once
// Targets a rename run must leave untouched. Only local targets are accepted;
// anything else is rejected when the set is built, never during a run.

#include <initializer_list>
#include <unordered_set>
#include <vector>

#include "rnm/target/target.hpp"

namespace rnm {

class SkipSet {
  public:
    SkipSet() = default;
    // Throws InvalidAddressError on the first non-local target.
    explicit SkipSet(const std::vector<Target>& targets);
    SkipSet(std::initializer_list<Target> targets);

    void add(const Target& t);
    bool remove(const Target& t) { return mTargets.erase(t) > 0; }

    bool contains(const Target& t) const { return mTargets.count(t) != 0; }
    bool empty() const { return mTargets.empty(); }
    size_t size() const { return mTargets.size(); }

    // Sorted by text for stable listings.
    std::vector<Target> sorted() const;

  private:
    std::unordered_set<Target, Target::Hash> mTargets;
};

} // namespace rnm
