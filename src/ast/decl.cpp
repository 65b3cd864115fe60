#include <algorithm>
#include <sstream>

#include "rnm/ast/decl.hpp"

namespace rnm::ast {

IdString Stmt::declName() const {
    return visit([](const auto& node) -> IdString {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, WireDecl> ||
                      std::is_same_v<T, RegDecl> ||
                      std::is_same_v<T, NodeDecl> ||
                      std::is_same_v<T, InstanceDecl> ||
                      std::is_same_v<T, MemDecl>) {
            return node.mName;
        } else {
            return IdString();
        }
    });
}

IdString DefModule::name() const {
    return visit([](const auto& m) { return m.mName; });
}

const std::vector<Port>& DefModule::ports() const {
    return visit(
      [](const auto& m) -> const std::vector<Port>& { return m.mPorts; });
}

int Circuit::findModuleIndex(IdString n) const {
    auto it = std::find_if(mModules.begin(), mModules.end(),
                           [n](auto& m) { return m.name() == n; });
    return (it != mModules.end())
             ? static_cast<int>(std::distance(mModules.begin(), it))
             : -1;
}

const DefModule* Circuit::findModule(IdString n) const {
    int idx = findModuleIndex(n);
    return idx < 0 ? nullptr : &mModules[static_cast<size_t>(idx)];
}

std::vector<IdString> collectDeclNames(const Module& m) {
    std::vector<IdString> out;
    for (const auto& p : m.mPorts)
        out.push_back(p.mName);
    forEachStmt(m.mBody, [&](const Stmt& s) {
        if (IdString n = s.declName(); n.valid()) out.push_back(n);
    });
    return out;
}

static void dumpNames(const char* key, const std::vector<IdString>& names,
                      std::ostream& os, int indent) {
    for (const auto& n : names)
        os << Indent(indent) << key << " => " << n.str() << "\n";
}

static void dumpBody(const std::vector<Stmt>& body, std::ostream& os,
                     int indent) {
    if (body.empty()) {
        os << Indent(indent) << "skip\n";
        return;
    }
    for (const auto& s : body)
        dumpStmt(s, os, indent);
}

void dumpStmt(const Stmt& s, std::ostream& os, int indent) {
    s.visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, WireDecl>) {
            os << Indent(indent) << "wire " << node.mName.str() << " : "
               << typeToString(node.mType) << "\n";
        } else if constexpr (std::is_same_v<T, RegDecl>) {
            os << Indent(indent) << "reg " << node.mName.str() << " : "
               << typeToString(node.mType) << ", "
               << exprToString(node.mClock);
            if (node.mReset && node.mInit) {
                os << " with : (reset => (" << exprToString(*node.mReset)
                   << ", " << exprToString(*node.mInit) << "))";
            }
            os << "\n";
        } else if constexpr (std::is_same_v<T, NodeDecl>) {
            os << Indent(indent) << "node " << node.mName.str() << " = "
               << exprToString(node.mValue) << "\n";
        } else if constexpr (std::is_same_v<T, InstanceDecl>) {
            os << Indent(indent) << "inst " << node.mName.str() << " of "
               << node.mModule.str() << "\n";
        } else if constexpr (std::is_same_v<T, MemDecl>) {
            os << Indent(indent) << "mem " << node.mName.str() << " :\n";
            os << Indent(indent + 2)
               << "data-type => " << typeToString(node.mDataType) << "\n";
            os << Indent(indent + 2) << "depth => " << node.mDepth << "\n";
            os << Indent(indent + 2) << "read-latency => "
               << node.mReadLatency << "\n";
            os << Indent(indent + 2) << "write-latency => "
               << node.mWriteLatency << "\n";
            dumpNames("reader", node.mReaders, os, indent + 2);
            dumpNames("writer", node.mWriters, os, indent + 2);
            dumpNames("readwriter", node.mReadWriters, os, indent + 2);
        } else if constexpr (std::is_same_v<T, ConnectStmt>) {
            os << Indent(indent) << exprToString(node.mLoc)
               << " <= " << exprToString(node.mExpr) << "\n";
        } else if constexpr (std::is_same_v<T, InvalidateStmt>) {
            os << Indent(indent) << exprToString(node.mExpr)
               << " is invalid\n";
        } else if constexpr (std::is_same_v<T, WhenStmt>) {
            os << Indent(indent) << "when " << exprToString(node.mCond)
               << " :\n";
            dumpBody(node.mThen, os, indent + 2);
            if (!node.mElse.empty()) {
                os << Indent(indent) << "else :\n";
                dumpBody(node.mElse, os, indent + 2);
            }
        } else if constexpr (std::is_same_v<T, BlockStmt>) {
            for (const auto& c : node.mStmts)
                dumpStmt(c, os, indent);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled statement kind");
        }
    });
}

void dumpModule(const DefModule& m, std::ostream& os, int indent) {
    os << Indent(indent) << (m.isExternal() ? "extmodule " : "module ")
       << m.name().str() << " :\n";
    for (const auto& p : m.ports()) {
        os << Indent(indent + 2) << to_string(p.mDir) << " " << p.mName.str()
           << " : " << typeToString(p.mType) << "\n";
    }
    if (m.isExternal()) {
        const auto& ext = m.as<ExtModule>();
        if (!ext.mDefName.empty())
            os << Indent(indent + 2) << "defname = " << ext.mDefName << "\n";
        return;
    }
    const auto& body = m.as<Module>().mBody;
    if (!body.empty()) os << "\n";
    dumpBody(body, os, indent + 2);
}

void dumpCircuit(const Circuit& c, std::ostream& os) {
    os << "circuit " << c.mName.str();
    if (c.mTop != c.mName) os << " (top " << c.mTop.str() << ")";
    os << " :\n";
    for (const auto& m : c.mModules)
        dumpModule(m, os, 2);
}

std::string circuitToString(const Circuit& c) {
    std::ostringstream oss;
    dumpCircuit(c, oss);
    return oss.str();
}
} // namespace rnm::ast
