#pragma once
// Record of old -> new target mappings produced by rename runs.
//
// record() stores a mapping as given. Composition happens between ledgers:
// compose(later) folds the records of a later run into this one so that
// A -> B followed by B -> C reads back as A -> C. An image whose leaf the
// later run left alone still follows the renames of its circuit, module,
// instance path and memory.

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rnm/target/target.hpp"

namespace rnm {

class RenameLedger {
  public:
    using Entry = std::pair<Target, std::vector<Target>>;

    void record(const Target& from, const Target& to);

    // All images of `from`, or nullptr if it was never renamed.
    const std::vector<Target>* get(const Target& from) const;
    // The image of `from` iff there is exactly one.
    std::optional<Target> resolve(const Target& from) const;

    void compose(const RenameLedger& later);

    bool empty() const { return mMap.empty(); }
    size_t size() const { return mMap.size(); }
    void clear() { mMap.clear(); }

    // Sorted by the text of the source target.
    std::vector<Entry> entries() const;

  private:
    std::unordered_map<Target, std::vector<Target>, Target::Hash> mMap;
};

} // namespace rnm
