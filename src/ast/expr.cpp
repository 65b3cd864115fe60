#include <sstream>

#include "rnm/ast/expr.hpp"

namespace rnm::ast {

namespace {
struct PrimOpName {
    PrimOp mOp;
    const char* mName;
};
constexpr PrimOpName kPrimOpNames[] = {
  {PrimOp::Add, "add"}, {PrimOp::Sub, "sub"}, {PrimOp::Mul, "mul"},
  {PrimOp::Lt, "lt"},   {PrimOp::Gt, "gt"},   {PrimOp::Eq, "eq"},
  {PrimOp::Neq, "neq"}, {PrimOp::And, "and"}, {PrimOp::Or, "or"},
  {PrimOp::Xor, "xor"}, {PrimOp::Not, "not"}, {PrimOp::Cat, "cat"},
  {PrimOp::Bits, "bits"}, {PrimOp::Pad, "pad"},
};
} // namespace

const char* to_string(PrimOp op) {
    for (const auto& p : kPrimOpNames)
        if (p.mOp == op) return p.mName;
    return "?";
}

std::optional<PrimOp> parsePrimOp(std::string_view s) {
    for (const auto& p : kPrimOpNames)
        if (s == p.mName) return p.mOp;
    return std::nullopt;
}

std::string typeToString(const Type& t) {
    switch (t.mKind) {
    case Type::Kind::UInt: return "UInt<" + std::to_string(t.mWidth) + ">";
    case Type::Kind::SInt: return "SInt<" + std::to_string(t.mWidth) + ">";
    case Type::Kind::Clock: return "Clock";
    case Type::Kind::Reset: return "Reset";
    }
    return "?";
}

static void exprToStringImpl(const Expr& e, std::ostream& os) {
    e.visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, RefExpr>) {
            os << node.mName.str();
        } else if constexpr (std::is_same_v<T, SubFieldExpr>) {
            exprToStringImpl(*node.mBase, os);
            os << "." << node.mField.str();
        } else if constexpr (std::is_same_v<T, LiteralExpr>) {
            os << (node.mSigned ? "SInt" : "UInt");
            if (node.mWidth > 0) os << "<" << node.mWidth << ">";
            os << "(" << node.mValue << ")";
        } else if constexpr (std::is_same_v<T, PrimOpExpr>) {
            os << to_string(node.mOp) << "(";
            bool first = true;
            for (const auto& a : node.mArgs) {
                if (!first) os << ", ";
                exprToStringImpl(a, os);
                first = false;
            }
            for (auto c : node.mConsts) {
                if (!first) os << ", ";
                os << c;
                first = false;
            }
            os << ")";
        } else if constexpr (std::is_same_v<T, MuxExpr>) {
            os << "mux(";
            exprToStringImpl(*node.mCond, os);
            os << ", ";
            exprToStringImpl(*node.mTval, os);
            os << ", ";
            exprToStringImpl(*node.mFval, os);
            os << ")";
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled expression kind");
        }
    });
}

std::string exprToString(const Expr& e) {
    std::ostringstream oss;
    exprToStringImpl(e, oss);
    return oss.str();
}
} // namespace rnm::ast
