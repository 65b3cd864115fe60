#include "rnm/rename/namespace.hpp"

namespace rnm {

Namespace Namespace::fromNames(const std::vector<IdString>& names) {
    Namespace ns;
    for (const auto& n : names)
        ns.mNames.insert(n);
    return ns;
}

Namespace Namespace::fromModule(const ast::Module& m) {
    return fromNames(ast::collectDeclNames(m));
}

Namespace Namespace::fromCircuit(const ast::Circuit& c) {
    Namespace ns;
    for (const auto& m : c.mModules)
        ns.mNames.insert(m.name());
    return ns;
}

bool Namespace::contains(std::string_view name) const {
    IdString id = IdString::tryLookup(name);
    return id.valid() && mNames.count(id) != 0;
}

void Namespace::reserve(std::string_view name) {
    mNames.insert(IdString(name));
}

std::string Namespace::newName(std::string_view base) {
    if (!contains(base)) {
        reserve(base);
        return std::string(base);
    }
    std::string key(base);
    uint32_t& idx = mNextIndex[key];
    std::string candidate;
    do {
        candidate = key + kDelim + std::to_string(idx++);
    } while (contains(candidate));
    reserve(candidate);
    return candidate;
}

std::string Namespace::allocate(std::string_view base,
                                const NameSet& extraReserved) {
    std::string candidate = std::string(base) + kDelim;
    while (contains(candidate) || extraReserved.count(candidate) != 0)
        candidate.push_back(kDelim);
    reserve(candidate);
    return candidate;
}
} // namespace rnm
