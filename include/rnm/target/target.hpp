#pragma once
// Addresses of renamable entities. A closed sum of four variants; the engine
// and the ledger key everything by these values.
//
// Text form (FIRRTL target syntax):
//   ~Circuit                          circuit
//   ~Circuit|Module                   module
//   ~Circuit|Module/inst:Of           instance (path hops precede the last)
//   ~Circuit|Module/a:A>ref.field     reference, optionally through a path

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rnm/common.hpp"
#include "rnm/util/id_string.hpp"

namespace rnm {

struct InstanceHop {
    IdString mInstance;
    IdString mOfModule;
    bool operator==(const InstanceHop& o) const {
        return mInstance == o.mInstance && mOfModule == o.mOfModule;
    }
};
using InstancePath = std::vector<InstanceHop>;

struct ReferenceAddr;
struct InstanceAddr;

struct CircuitAddr {
    IdString mCircuit;
    bool operator==(const CircuitAddr& o) const {
        return mCircuit == o.mCircuit;
    }
};

struct ModuleAddr {
    IdString mCircuit;
    IdString mModule;

    ReferenceAddr ref(IdString name) const;
    InstanceAddr instOf(IdString inst, IdString ofModule) const;
    CircuitAddr circuitAddr() const { return CircuitAddr{mCircuit}; }

    bool operator==(const ModuleAddr& o) const {
        return mCircuit == o.mCircuit && mModule == o.mModule;
    }
};

struct InstanceAddr {
    IdString mCircuit;
    IdString mModule; // module that declares the instance
    InstancePath mPath;
    IdString mInstance;
    IdString mOfModule;

    bool isLocal() const { return mPath.empty(); }
    ModuleAddr moduleAddr() const { return ModuleAddr{mCircuit, mModule}; }
    ModuleAddr ofModuleAddr() const { return ModuleAddr{mCircuit, mOfModule}; }

    bool operator==(const InstanceAddr& o) const {
        return mCircuit == o.mCircuit && mModule == o.mModule &&
               mPath == o.mPath && mInstance == o.mInstance &&
               mOfModule == o.mOfModule;
    }
};

struct ReferenceAddr {
    IdString mCircuit;
    IdString mModule;
    InstancePath mPath;
    IdString mRef;
    std::vector<IdString> mFields;

    bool isLocal() const { return mPath.empty(); }
    ModuleAddr moduleAddr() const { return ModuleAddr{mCircuit, mModule}; }
    ReferenceAddr field(IdString f) const;
    // Same address without field components.
    ReferenceAddr base() const;

    bool operator==(const ReferenceAddr& o) const {
        return mCircuit == o.mCircuit && mModule == o.mModule &&
               mPath == o.mPath && mRef == o.mRef && mFields == o.mFields;
    }
};

struct Target {
    using Variant =
      std::variant<CircuitAddr, ModuleAddr, InstanceAddr, ReferenceAddr>;
    Variant mNode;

    Target() = default;
    Target(CircuitAddr a)
        : mNode(std::move(a)) {}
    Target(ModuleAddr a)
        : mNode(std::move(a)) {}
    Target(InstanceAddr a)
        : mNode(std::move(a)) {}
    Target(ReferenceAddr a)
        : mNode(std::move(a)) {}

    static Target circuit(std::string_view c) {
        return CircuitAddr{IdString(c)};
    }
    static Target module(std::string_view c, std::string_view m) {
        return ModuleAddr{IdString(c), IdString(m)};
    }

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(mNode);
    }
    template <typename T>
    const T& as() const {
        return std::get<T>(mNode);
    }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& vis) const {
        return std::visit(std::forward<Visitor>(vis), mNode);
    }

    // True iff the address has no instance path.
    bool isLocal() const;
    IdString circuitName() const;
    // Enclosing module; empty for circuit addresses.
    std::optional<ModuleAddr> moduleAddr() const;

    // Terminal component a rename replaces. Throws InternalError when a
    // reference carries more than one field.
    IdString leafName() const;
    Target withLeafName(IdString name) const;

    std::string toString() const;

    bool operator==(const Target& o) const { return mNode == o.mNode; }
    bool operator!=(const Target& o) const { return !(*this == o); }

    struct Hash {
        size_t operator()(const Target& t) const noexcept;
    };
};

// Inverse of Target::toString. Throws ConfigError on malformed text.
Target parseTarget(std::string_view text);

std::ostream& operator<<(std::ostream& os, const Target& t);

} // namespace rnm
