#pragma once
// Module instantiation graph of a circuit and the leaf-to-root module order
// the rename engine walks.

#include <ostream>
#include <unordered_map>
#include <vector>

#include "rnm/ast/decl.hpp"
#include "rnm/util/id_string.hpp"

namespace rnm {

class InstanceGraph {
  public:
    // Instances of modules the circuit does not declare are reported to
    // `diag` and left out of the graph.
    explicit InstanceGraph(const ast::Circuit& c, std::ostream* diag = nullptr);

    // Distinct modules instantiated by `module`, in first-use order.
    const std::vector<IdString>& children(IdString module) const;

    // Every declared module exactly once; a module never precedes one it
    // instantiates. Reachable modules come first, in post-order from the top
    // module, followed by the rest in declaration order. Throws
    // InternalError on an instantiation cycle.
    std::vector<const ast::DefModule*> moduleOrder() const;

  private:
    const ast::Circuit& mCircuit;
    std::unordered_map<IdString, std::vector<IdString>, IdString::Hash>
      mChildren;
};

} // namespace rnm
