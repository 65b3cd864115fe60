#pragma once
// Statements, modules and the circuit. Expressions reference declarations by
// name only; there are no back-pointers, so renaming is a pure rebuild.

#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "rnm/ast/expr.hpp"
#include "rnm/common.hpp"
#include "rnm/util/id_string.hpp"

namespace rnm::ast {

struct Port {
    IdString mName;
    PortDirection mDir = PortDirection::In;
    Type mType;
};

struct WireDecl {
    IdString mName;
    Type mType;
};

struct RegDecl {
    IdString mName;
    Type mType;
    Expr mClock;
    std::optional<Expr> mReset; // present together with mInit
    std::optional<Expr> mInit;
};

struct NodeDecl {
    IdString mName;
    Expr mValue;
};

struct InstanceDecl {
    IdString mName;   // local alias
    IdString mModule; // instantiated module
};

struct MemDecl {
    IdString mName;
    Type mDataType;
    uint64_t mDepth = 1;
    int mReadLatency = 0;
    int mWriteLatency = 1;
    std::vector<IdString> mReaders;
    std::vector<IdString> mWriters;
    std::vector<IdString> mReadWriters;
};

struct ConnectStmt {
    Expr mLoc;
    Expr mExpr;
};

struct InvalidateStmt {
    Expr mExpr;
};

struct Stmt;

struct WhenStmt {
    Expr mCond;
    std::vector<Stmt> mThen;
    std::vector<Stmt> mElse;
};

struct BlockStmt {
    std::vector<Stmt> mStmts;
};

struct Stmt {
    using Variant =
      std::variant<WireDecl, RegDecl, NodeDecl, InstanceDecl, MemDecl,
                   ConnectStmt, InvalidateStmt, WhenStmt, BlockStmt>;
    Variant mNode;

    Stmt() = default;
    explicit Stmt(Variant v)
        : mNode(std::move(v)) {}

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

    // Declared name for wire/reg/node/instance/memory, invalid otherwise.
    IdString declName() const;
};

struct Module {
    IdString mName;
    std::vector<Port> mPorts;
    std::vector<Stmt> mBody;
};

// Opaque black box: only its name is visible to the renamer.
struct ExtModule {
    IdString mName;
    std::vector<Port> mPorts;
    std::string mDefName;
};

struct DefModule {
    using Variant = std::variant<Module, ExtModule>;
    Variant mNode;

    DefModule() = default;
    explicit DefModule(Variant v)
        : mNode(std::move(v)) {}

    bool isExternal() const { return is<ExtModule>(); }
    IdString name() const;
    const std::vector<Port>& ports() const;

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
};

struct Circuit {
    IdString mName;
    IdString mTop; // top module; equals mName unless the two were renamed apart
    std::vector<DefModule> mModules;

    static Circuit make(IdString name, std::vector<DefModule> modules) {
        return Circuit{name, name, std::move(modules)};
    }

    int findModuleIndex(IdString n) const;
    const DefModule* findModule(IdString n) const;
};

//******************************************************************************
// Structural combinators
//******************************************************************************

// Rebuild `s` with `f` applied to each expression it holds directly.
// Expressions inside nested statements are not visited.
template <typename F>
Stmt mapExprs(const Stmt& s, F&& f) {
    return s.visit([&](const auto& node) -> Stmt {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, WireDecl> ||
                      std::is_same_v<T, InstanceDecl> ||
                      std::is_same_v<T, MemDecl> ||
                      std::is_same_v<T, BlockStmt>) {
            return Stmt(node);
        } else if constexpr (std::is_same_v<T, RegDecl>) {
            RegDecl out = node;
            out.mClock = f(node.mClock);
            if (node.mReset) out.mReset = f(*node.mReset);
            if (node.mInit) out.mInit = f(*node.mInit);
            return Stmt(std::move(out));
        } else if constexpr (std::is_same_v<T, NodeDecl>) {
            return Stmt(NodeDecl{node.mName, f(node.mValue)});
        } else if constexpr (std::is_same_v<T, ConnectStmt>) {
            return Stmt(ConnectStmt{f(node.mLoc), f(node.mExpr)});
        } else if constexpr (std::is_same_v<T, InvalidateStmt>) {
            return Stmt(InvalidateStmt{f(node.mExpr)});
        } else if constexpr (std::is_same_v<T, WhenStmt>) {
            return Stmt(WhenStmt{f(node.mCond), node.mThen, node.mElse});
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled statement kind");
        }
    });
}

// Rebuild `s` with `f` applied to each directly nested statement, in order.
template <typename F>
Stmt mapStmts(const Stmt& s, F&& f) {
    auto mapBody = [&](const std::vector<Stmt>& body) {
        std::vector<Stmt> out;
        out.reserve(body.size());
        for (const auto& c : body)
            out.push_back(f(c));
        return out;
    };
    if (s.is<WhenStmt>()) {
        const auto& w = s.as<WhenStmt>();
        auto thenx = mapBody(w.mThen);
        auto elsex = mapBody(w.mElse);
        return Stmt(WhenStmt{w.mCond, std::move(thenx), std::move(elsex)});
    }
    if (s.is<BlockStmt>()) {
        return Stmt(BlockStmt{mapBody(s.as<BlockStmt>().mStmts)});
    }
    return s;
}

// Pre-order walk over every statement of `body`, nested ones included.
template <typename F>
void forEachStmt(const std::vector<Stmt>& body, F&& f) {
    for (const auto& s : body) {
        f(s);
        if (s.is<WhenStmt>()) {
            forEachStmt(s.as<WhenStmt>().mThen, f);
            forEachStmt(s.as<WhenStmt>().mElse, f);
        } else if (s.is<BlockStmt>()) {
            forEachStmt(s.as<BlockStmt>().mStmts, f);
        }
    }
}

// Port names followed by every declaration of the body, in walk order.
std::vector<IdString> collectDeclNames(const Module& m);

// Debug rendering, FIRRTL-like.
void dumpStmt(const Stmt& s, std::ostream& os, int indent = 0);
void dumpModule(const DefModule& m, std::ostream& os, int indent = 0);
void dumpCircuit(const Circuit& c, std::ostream& os);
std::string circuitToString(const Circuit& c);

} // namespace rnm::ast
