#include <unordered_map>
#include <unordered_set>

#include "rnm/rename/engine.hpp"
#include "rnm/rename/instance_graph.hpp"
#include "rnm/rename/instance_map.hpp"

namespace rnm {

struct RenameEngine::Context {
    const SkipSet& mSkips;
    IdString mCircuit;    // name the input circuit had
    IdString mNewCircuit; // name the output circuit gets
    std::unordered_map<Target, Namespace, Target::Hash> mNamespaces;
    // Module names as they stand so far in this run
    std::unordered_set<IdString, IdString::Hash> mModuleNames;
    InstanceMap mInstances;
    RenameLedger mLedger; // this run only

    Context(const SkipSet& skips, IdString circuit)
        : mSkips(skips), mCircuit(circuit), mNewCircuit(circuit) {}

    IdString current(const ModuleAddr& m) const {
        auto image = mLedger.resolve(m);
        return image ? image->leafName() : m.mModule;
    }

    void renameModule(IdString from, IdString to) {
        if (from == to) return;
        mModuleNames.erase(from);
        mModuleNames.insert(to);
        scope(CircuitAddr{mCircuit}).reserve(to.str());
    }

    Namespace& scope(const Target& key) {
        auto it = mNamespaces.find(key);
        if (it == mNamespaces.end())
            throw InternalError("no namespace for " + key.toString());
        return it->second;
    }

    // `t` with every enclosing name replaced by what it has been renamed to
    // so far in this run. The leaf is left as it is.
    Target relocate(const Target& t) const {
        return t.visit([this](auto a) -> Target {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, ReferenceAddr>) {
                if (!a.mFields.empty()) {
                    if (auto image = mLedger.resolve(a.base()))
                        a.mRef = image->leafName();
                }
            }
            if constexpr (!std::is_same_v<T, CircuitAddr>) {
                a.mModule = current(ModuleAddr{mCircuit, a.mModule});
            }
            if constexpr (std::is_same_v<T, InstanceAddr>) {
                a.mOfModule = current(ModuleAddr{mCircuit, a.mOfModule});
            }
            a.mCircuit = mNewCircuit;
            return a;
        });
    }
};

RenameEngine::RenameEngine(ManipulateRule rule, std::ostream* diag)
    : mRule(std::move(rule)), mDiag(diag) {}

IdString RenameEngine::doRename(IdString name, const Target& target,
                                Namespace& ns, Context& cx,
                                const NameSet* taken) const {
    if (cx.mSkips.contains(target)) {
        info(mDiag, "skip " + target.toString(), 2);
        return name;
    }
    auto out = mRule(name.str(), ns);
    if (!out || *out == name.str()) return name;
    if (taken) {
        std::string base = *out;
        while (taken->count(IdString(*out)))
            out = ns.newName(base);
    }

    IdString renamed(*out);
    Target image = cx.relocate(target).withLeafName(renamed);
    cx.mLedger.record(target, image);
    info(mDiag, target.toString() + " -> " + image.toString(), 2);
    return renamed;
}

IdString RenameEngine::maybeRename(IdString name, const Target& target,
                                   const Context& cx) const {
    auto image = cx.mLedger.resolve(target);
    return image ? image->leafName() : name;
}

ast::Expr RenameEngine::onExpr(const ast::Expr& e, const ModuleAddr& mod,
                               const Context& cx) const {
    using ast::Expr;
    if (e.is<ast::RefExpr>()) {
        IdString n = e.as<ast::RefExpr>().mName;
        return Expr::ref(maybeRename(n, mod.ref(n), cx));
    }
    if (!e.is<ast::SubFieldExpr>()) {
        return ast::mapSubExprs(
          e, [&](const Expr& sub) { return onExpr(sub, mod, cx); });
    }

    const auto& sf = e.as<ast::SubFieldExpr>();
    const Expr& base = *sf.mBase;

    // inst.port or mem.port
    if (base.is<ast::RefExpr>()) {
        IdString baseName = base.as<ast::RefExpr>().mName;
        ReferenceAddr local = mod.ref(baseName);
        if (const auto* inst = cx.mInstances.instance(local)) {
            return Expr::subField(
              Expr::ref(maybeRename(baseName, *inst, cx)),
              maybeRename(sf.mField, inst->ofModuleAddr().ref(sf.mField), cx));
        }
        if (const auto* mem = cx.mInstances.memory(local)) {
            return Expr::subField(
              Expr::ref(maybeRename(baseName, *mem, cx)),
              maybeRename(sf.mField, mem->field(sf.mField), cx));
        }
        throw InternalError("subfield base '" + baseName.str() +
                            "' in module " + mod.mModule.str() +
                            " is neither an instance nor a memory: " +
                            ast::exprToString(e));
    }

    // mem.port.field; the innermost field belongs to the memory port schema
    if (base.is<ast::SubFieldExpr>()) {
        const auto& portSf = base.as<ast::SubFieldExpr>();
        if (portSf.mBase->is<ast::RefExpr>()) {
            IdString memName = portSf.mBase->as<ast::RefExpr>().mName;
            ReferenceAddr memAddr = mod.ref(memName);
            if (cx.mInstances.memory(memAddr)) {
                Expr memx = Expr::ref(maybeRename(memName, memAddr, cx));
                Expr portx = Expr::subField(
                  std::move(memx),
                  maybeRename(portSf.mField, memAddr.field(portSf.mField), cx));
                return Expr::subField(std::move(portx), sf.mField);
            }
        }
    }
    throw InternalError("unexpected subfield shape in module " +
                        mod.mModule.str() + ": " + ast::exprToString(e));
}

static ast::Stmt withDeclName(const ast::Stmt& s, IdString name) {
    return s.visit([name](auto node) -> ast::Stmt {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::WireDecl> ||
                      std::is_same_v<T, ast::RegDecl> ||
                      std::is_same_v<T, ast::NodeDecl> ||
                      std::is_same_v<T, ast::InstanceDecl> ||
                      std::is_same_v<T, ast::MemDecl>) {
            node.mName = name;
        }
        return ast::Stmt(std::move(node));
    });
}

ast::Stmt RenameEngine::onStmt(const ast::Stmt& s, const ModuleAddr& mod,
                               Context& cx) const {
    auto mapExpr = [&](const ast::Expr& e) { return onExpr(e, mod, cx); };
    Namespace& ns = cx.scope(mod);

    if (s.is<ast::InstanceDecl>()) {
        const auto& inst = s.as<ast::InstanceDecl>();
        IdString modx = cx.current(ModuleAddr{cx.mCircuit, inst.mModule});
        InstanceAddr addr = mod.instOf(inst.mName, inst.mModule);
        IdString instx = doRename(inst.mName, addr, ns, cx);
        cx.mInstances.addInstance(mod.ref(inst.mName), addr);
        return ast::Stmt(ast::InstanceDecl{instx, modx});
    }

    if (s.is<ast::MemDecl>()) {
        ast::MemDecl mem = s.as<ast::MemDecl>();
        ReferenceAddr addr = mod.ref(mem.mName);
        mem.mName = doRename(mem.mName, addr, ns, cx);

        std::vector<IdString> portNames = mem.mReaders;
        portNames.insert(portNames.end(), mem.mWriters.begin(),
                         mem.mWriters.end());
        portNames.insert(portNames.end(), mem.mReadWriters.begin(),
                         mem.mReadWriters.end());
        Namespace& memNs =
          cx.mNamespaces.insert_or_assign(addr, Namespace::fromNames(portNames))
            .first->second;
        cx.mInstances.addMemory(addr);

        for (auto* ports : {&mem.mReaders, &mem.mWriters, &mem.mReadWriters}) {
            for (auto& p : *ports)
                p = doRename(p, addr.field(p), memNs, cx);
        }
        return ast::Stmt(std::move(mem));
    }

    if (IdString name = s.declName(); name.valid()) {
        IdString namex = doRename(name, mod.ref(name), ns, cx);
        return withDeclName(ast::mapExprs(s, mapExpr), namex);
    }

    auto nested = ast::mapStmts(
      s, [&](const ast::Stmt& c) { return onStmt(c, mod, cx); });
    return ast::mapExprs(nested, mapExpr);
}

ast::DefModule RenameEngine::onModule(const ast::DefModule& m,
                                      Context& cx) const {
    ModuleAddr addr{cx.mCircuit, m.name()};

    if (m.isExternal()) {
        ast::ExtModule ext = m.as<ast::ExtModule>();
        ext.mName = doRename(ext.mName, addr, cx.scope(addr.circuitAddr()), cx,
                             &cx.mModuleNames);
        cx.renameModule(addr.mModule, ext.mName);
        return ast::DefModule(std::move(ext));
    }

    const auto& mod = m.as<ast::Module>();
    info(mDiag, "module " + mod.mName.str());
    Namespace& ns =
      cx.mNamespaces.insert_or_assign(addr, Namespace::fromModule(mod))
        .first->second;

    ast::Module out;
    // Named in its own scope, but distinct from every other module name
    out.mName = doRename(mod.mName, addr, ns, cx, &cx.mModuleNames);
    cx.renameModule(mod.mName, out.mName);
    out.mPorts.reserve(mod.mPorts.size());
    for (const auto& p : mod.mPorts) {
        ast::Port px = p;
        px.mName = doRename(p.mName, addr.ref(p.mName), ns, cx);
        out.mPorts.push_back(std::move(px));
    }
    out.mBody.reserve(mod.mBody.size());
    for (const auto& s : mod.mBody)
        out.mBody.push_back(onStmt(s, addr, cx));
    return ast::DefModule(std::move(out));
}

ast::Circuit RenameEngine::run(const ast::Circuit& c, RenameLedger& ledger,
                               const SkipSet& skips) const {
    CircuitAddr caddr{c.mName};
    if (skips.contains(caddr)) {
        info(mDiag, "circuit " + c.mName.str() + " is skipped, nothing renamed");
        return c;
    }

    Context cx(skips, c.mName);
    Namespace& cns =
      cx.mNamespaces.emplace(caddr, Namespace::fromCircuit(c)).first->second;
    cx.mNewCircuit = doRename(c.mName, caddr, cns, cx);
    for (const auto& m : c.mModules)
        cx.mModuleNames.insert(m.name());

    InstanceGraph graph(c, mDiag);
    std::unordered_map<IdString, ast::DefModule, IdString::Hash> renamed;
    for (const auto* m : graph.moduleOrder())
        renamed.emplace(m->name(), onModule(*m, cx));

    ast::Circuit out;
    out.mName = cx.mNewCircuit;
    out.mTop = cx.current(ModuleAddr{c.mName, c.mTop});
    out.mModules.reserve(c.mModules.size());
    for (const auto& m : c.mModules) {
        auto it = renamed.find(m.name());
        if (it == renamed.end())
            throw InternalError("module " + m.name().str() +
                                " missing from the module order");
        out.mModules.push_back(it->second);
    }

    info(mDiag, std::to_string(cx.mLedger.size()) + " rename(s) recorded");
    ledger.compose(cx.mLedger);
    return out;
}
} // namespace rnm
