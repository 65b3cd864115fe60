#pragma once
// Per-scope set of reserved names. Scopes do not nest: a module namespace
// knows nothing about the circuit namespace or another module's.

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rnm/ast/decl.hpp"
#include "rnm/util/id_string.hpp"

namespace rnm {

class Namespace {
  public:
    using NameSet = std::unordered_set<std::string>;

    static constexpr char kDelim = '_';

    Namespace() = default;

    static Namespace fromNames(const std::vector<IdString>& names);
    // Port names plus every declaration in the body.
    static Namespace fromModule(const ast::Module& m);
    // Module names of the circuit.
    static Namespace fromCircuit(const ast::Circuit& c);

    bool contains(std::string_view name) const;
    void reserve(std::string_view name);

    // `base` if free, else the first free of base_0, base_1, ...; the
    // result is reserved.
    std::string newName(std::string_view base);

    // base + "_" (+ "_" ...) until the candidate is free here and not in
    // `extraReserved`; the result is reserved.
    std::string allocate(std::string_view base, const NameSet& extraReserved);

    size_t size() const { return mNames.size(); }

  private:
    std::unordered_set<IdString, IdString::Hash> mNames;
    std::unordered_map<std::string, uint32_t> mNextIndex;
};

} // namespace rnm
