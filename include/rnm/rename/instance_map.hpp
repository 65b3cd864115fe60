#pragma once
// Per-run table telling what a module-local name used as a subfield base
// denotes: an instance of some module, or a memory.

#include <unordered_map>
#include <variant>

#include "rnm/target/target.hpp"

namespace rnm {

class InstanceMap {
  public:
    // Keys are local reference addresses of the declaring module, taken
    // before the declaration is renamed.
    using Entry = std::variant<InstanceAddr, ReferenceAddr>;

    void addInstance(const ReferenceAddr& local, const InstanceAddr& inst) {
        mEntries.insert_or_assign(Target(local), Entry(inst));
    }
    void addMemory(const ReferenceAddr& mem) {
        mEntries.insert_or_assign(Target(mem), Entry(mem));
    }

    const Entry* find(const ReferenceAddr& local) const {
        auto it = mEntries.find(Target(local));
        return it == mEntries.end() ? nullptr : &it->second;
    }
    const InstanceAddr* instance(const ReferenceAddr& local) const {
        const Entry* e = find(local);
        return e ? std::get_if<InstanceAddr>(e) : nullptr;
    }
    const ReferenceAddr* memory(const ReferenceAddr& local) const {
        const Entry* e = find(local);
        return e ? std::get_if<ReferenceAddr>(e) : nullptr;
    }

    size_t size() const { return mEntries.size(); }

  private:
    std::unordered_map<Target, Entry, Target::Hash> mEntries;
};

} // namespace rnm
