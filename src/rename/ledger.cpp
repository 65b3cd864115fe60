#include <algorithm>
#include <type_traits>

#include "rnm/rename/ledger.hpp"

namespace rnm {

static void appendUnique(std::vector<Target>& out, const Target& t) {
    if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
}

void RenameLedger::record(const Target& from, const Target& to) {
    appendUnique(mMap[from], to);
}

const std::vector<Target>* RenameLedger::get(const Target& from) const {
    auto it = mMap.find(from);
    return it == mMap.end() ? nullptr : &it->second;
}

std::optional<Target> RenameLedger::resolve(const Target& from) const {
    const auto* images = get(from);
    if (!images || images->size() != 1) return std::nullopt;
    return images->front();
}

// Leaf of the single image of `t` in `l`, or `name` if there is none.
static IdString imageName(const RenameLedger& l, const Target& t,
                          IdString name) {
    auto image = l.resolve(t);
    return image ? image->leafName() : name;
}

// `t` with its enclosing circuit, module, instance path and memory names
// moved to what `later` renamed them to. The leaf is left as it is.
static Target rehome(const RenameLedger& later, const Target& t) {
    return t.visit([&later](auto a) -> Target {
        using T = std::decay_t<decltype(a)>;
        const IdString c = a.mCircuit;
        if constexpr (std::is_same_v<T, ReferenceAddr>) {
            if (!a.mFields.empty())
                a.mRef = imageName(later, a.base(), a.mRef);
        }
        if constexpr (std::is_same_v<T, InstanceAddr>) {
            a.mOfModule = imageName(later, ModuleAddr{c, a.mOfModule},
                                    a.mOfModule);
        }
        if constexpr (std::is_same_v<T, InstanceAddr> ||
                      std::is_same_v<T, ReferenceAddr>) {
            IdString parent = a.mModule;
            for (auto& hop : a.mPath) {
                IdString of = hop.mOfModule;
                ModuleAddr parentAddr{c, parent};
                hop.mInstance =
                  imageName(later, parentAddr.instOf(hop.mInstance, of),
                            hop.mInstance);
                hop.mOfModule = imageName(later, ModuleAddr{c, of}, of);
                parent = of;
            }
        }
        if constexpr (!std::is_same_v<T, CircuitAddr>) {
            a.mModule = imageName(later, ModuleAddr{c, a.mModule}, a.mModule);
        }
        a.mCircuit = imageName(later, CircuitAddr{c}, c);
        return a;
    });
}

void RenameLedger::compose(const RenameLedger& later) {
    // Images of earlier records that the later run renamed again point at the
    // later images; the others follow the renames of their enclosing scopes.
    for (auto& [from, images] : mMap) {
        std::vector<Target> updated;
        updated.reserve(images.size());
        for (const auto& img : images) {
            if (const auto* next = later.get(img)) {
                for (const auto& n : *next)
                    appendUnique(updated, n);
            } else {
                appendUnique(updated, rehome(later, img));
            }
        }
        images = std::move(updated);
    }
    for (const auto& [from, images] : later.mMap) {
        auto& slot = mMap[from];
        for (const auto& img : images)
            appendUnique(slot, img);
    }
}

std::vector<RenameLedger::Entry> RenameLedger::entries() const {
    std::vector<Entry> out(mMap.begin(), mMap.end());
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
        return a.first.toString() < b.first.toString();
    });
    return out;
}
} // namespace rnm
