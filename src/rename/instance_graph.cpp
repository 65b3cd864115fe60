#include <algorithm>
#include <unordered_set>

#include "rnm/rename/instance_graph.hpp"

namespace rnm {

InstanceGraph::InstanceGraph(const ast::Circuit& c, std::ostream* diag)
    : mCircuit(c) {
    for (const auto& m : c.mModules) {
        auto& kids = mChildren[m.name()];
        if (m.isExternal()) continue;
        ast::forEachStmt(m.as<ast::Module>().mBody, [&](const ast::Stmt& s) {
            if (!s.is<ast::InstanceDecl>()) return;
            const auto& inst = s.as<ast::InstanceDecl>();
            if (!c.findModule(inst.mModule)) {
                warn(diag, "instance " + inst.mName.str() + " in module " +
                             m.name().str() + " refers to undeclared module " +
                             inst.mModule.str());
                return;
            }
            if (std::find(kids.begin(), kids.end(), inst.mModule) ==
                kids.end())
                kids.push_back(inst.mModule);
        });
    }
}

const std::vector<IdString>& InstanceGraph::children(IdString module) const {
    static const std::vector<IdString> kNone;
    auto it = mChildren.find(module);
    return it == mChildren.end() ? kNone : it->second;
}

std::vector<const ast::DefModule*> InstanceGraph::moduleOrder() const {
    enum class Mark { Unvisited, Active, Done };
    std::unordered_map<IdString, Mark, IdString::Hash> marks;
    std::vector<const ast::DefModule*> order;
    order.reserve(mCircuit.mModules.size());

    // Iterative post-order DFS; the stack holds (module, next child index).
    auto visitFrom = [&](IdString root) {
        if (marks[root] != Mark::Unvisited) return;
        std::vector<std::pair<IdString, size_t>> stack{{root, 0}};
        marks[root] = Mark::Active;
        while (!stack.empty()) {
            auto& [mod, next] = stack.back();
            const auto& kids = children(mod);
            if (next < kids.size()) {
                IdString kid = kids[next++];
                Mark& km = marks[kid];
                if (km == Mark::Active) {
                    throw InternalError("module " + kid.str() +
                                        " instantiates itself through " +
                                        mod.str());
                }
                if (km == Mark::Unvisited) {
                    km = Mark::Active;
                    stack.emplace_back(kid, 0);
                }
                continue;
            }
            marks[mod] = Mark::Done;
            order.push_back(mCircuit.findModule(mod));
            stack.pop_back();
        }
    };

    if (mCircuit.findModule(mCircuit.mTop)) visitFrom(mCircuit.mTop);
    for (const auto& m : mCircuit.mModules)
        visitFrom(m.name());
    return order;
}
} // namespace rnm
