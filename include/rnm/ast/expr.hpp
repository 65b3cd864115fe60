#pragma once
// Expression and type AST using std::variant: RefExpr, SubFieldExpr,
// LiteralExpr, PrimOpExpr, MuxExpr.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "rnm/common.hpp"
#include "rnm/util/id_string.hpp"

namespace rnm::ast {

template <typename>
inline constexpr bool kAlwaysFalse = false;

struct Type {
    enum class Kind { UInt, SInt, Clock, Reset };
    Kind mKind = Kind::UInt;
    int mWidth = 1; // ignored for Clock and Reset

    static Type uintOf(int w) { return Type{Kind::UInt, w}; }
    static Type sintOf(int w) { return Type{Kind::SInt, w}; }
    static Type clock() { return Type{Kind::Clock, 1}; }
    static Type reset() { return Type{Kind::Reset, 1}; }

    bool operator==(const Type& o) const {
        if (mKind != o.mKind) return false;
        return (mKind == Kind::Clock || mKind == Kind::Reset) ||
               mWidth == o.mWidth;
    }
    bool operator!=(const Type& o) const { return !(*this == o); }
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct RefExpr {
    IdString mName;
};
// base.field; the base is shared because expressions are immutable once built
struct SubFieldExpr {
    ExprPtr mBase;
    IdString mField;
};
struct LiteralExpr {
    uint64_t mValue = 0;
    int mWidth = 0; // 0 => infer minimal
    bool mSigned = false;
};

enum class PrimOp {
    Add, Sub, Mul, Lt, Gt, Eq, Neq,
    And, Or, Xor, Not, Cat, Bits, Pad
};
struct PrimOpExpr {
    PrimOp mOp = PrimOp::Add;
    std::vector<Expr> mArgs;
    std::vector<int64_t> mConsts; // e.g. hi/lo for bits, width for pad
};
struct MuxExpr {
    ExprPtr mCond;
    ExprPtr mTval;
    ExprPtr mFval;
};

struct Expr {
    using Variant =
      std::variant<RefExpr, SubFieldExpr, LiteralExpr, PrimOpExpr, MuxExpr>;
    Variant mNode;

    Expr() = default;
    explicit Expr(Variant v)
        : mNode(std::move(v)) {}

    static Expr ref(IdString n) { return Expr(RefExpr{n}); }
    static Expr ref(std::string_view n) { return ref(IdString(n)); }
    static Expr subField(const Expr& base, IdString field) {
        return Expr(SubFieldExpr{std::make_shared<const Expr>(base), field});
    }
    static Expr subField(Expr&& base, IdString field) {
        return Expr(
          SubFieldExpr{std::make_shared<const Expr>(std::move(base)), field});
    }
    static Expr literal(uint64_t v, int w = 0, bool isSigned = false) {
        return Expr(LiteralExpr{v, w, isSigned});
    }
    static Expr prim(PrimOp op, std::vector<Expr> args,
                     std::vector<int64_t> consts = {}) {
        return Expr(PrimOpExpr{op, std::move(args), std::move(consts)});
    }
    static Expr mux(Expr cond, Expr tval, Expr fval) {
        return Expr(MuxExpr{std::make_shared<const Expr>(std::move(cond)),
                            std::make_shared<const Expr>(std::move(tval)),
                            std::make_shared<const Expr>(std::move(fval))});
    }

    // Chaining helper: Expr::ref(mem).field(port).field(addr)
    Expr field(IdString f) const { return subField(*this, f); }
    Expr field(std::string_view f) const { return field(IdString(f)); }

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

// Rebuild `e` with `f` applied to each direct sub-expression. Leaves are
// returned as they are.
template <typename F>
Expr mapSubExprs(const Expr& e, F&& f) {
    return e.visit([&](const auto& node) -> Expr {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, RefExpr> ||
                      std::is_same_v<T, LiteralExpr>) {
            return Expr(node);
        } else if constexpr (std::is_same_v<T, SubFieldExpr>) {
            return Expr::subField(f(*node.mBase), node.mField);
        } else if constexpr (std::is_same_v<T, PrimOpExpr>) {
            PrimOpExpr out{node.mOp, {}, node.mConsts};
            out.mArgs.reserve(node.mArgs.size());
            for (const auto& a : node.mArgs)
                out.mArgs.push_back(f(a));
            return Expr(std::move(out));
        } else if constexpr (std::is_same_v<T, MuxExpr>) {
            return Expr::mux(f(*node.mCond), f(*node.mTval), f(*node.mFval));
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled expression kind");
        }
    });
}

// Helpers implemented in src/ast/expr.cpp
const char* to_string(PrimOp op);
std::optional<PrimOp> parsePrimOp(std::string_view s);
std::string typeToString(const Type& t);
std::string exprToString(const Expr& e);

} // namespace rnm::ast
