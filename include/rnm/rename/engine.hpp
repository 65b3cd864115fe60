#pragma once
// Rule-driven renaming of every declared identifier of a circuit.
//
// One run renames the circuit name, then each module from the leaves up, so
// a module's port renames are in the run's ledger before any instantiating
// module rewrites its expressions. Use sites are rewritten by ledger lookup
// only; they never allocate names.
//
// Ledger keys carry the original circuit and module names. Images carry the
// names the enclosing entities have after the run, so the records of
// successive runs compose.

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>

#include "rnm/ast/decl.hpp"
#include "rnm/rename/ledger.hpp"
#include "rnm/rename/namespace.hpp"
#include "rnm/target/skip_set.hpp"

namespace rnm {

// (current name, scope namespace) -> new name, or nullopt to keep the name.
// A returned name must already be reserved in the namespace.
using ManipulateRule =
  std::function<std::optional<std::string>(const std::string&, Namespace&)>;

class RenameEngine {
  public:
    explicit RenameEngine(ManipulateRule rule, std::ostream* diag = nullptr);

    // Returns the renamed circuit and folds the run's renames into `ledger`.
    // On failure nothing is written to `ledger`. Throws InternalError when
    // the circuit holds an expression shape the renamer does not know.
    ast::Circuit run(const ast::Circuit& c, RenameLedger& ledger,
                     const SkipSet& skips = {}) const;

  private:
    struct Context;
    using NameSet = std::unordered_set<IdString, IdString::Hash>;

    // A rule result found in `taken` moves on to its base_0, base_1, ...
    IdString doRename(IdString name, const Target& target, Namespace& ns,
                      Context& cx, const NameSet* taken = nullptr) const;
    IdString maybeRename(IdString name, const Target& target,
                         const Context& cx) const;

    ast::Expr onExpr(const ast::Expr& e, const ModuleAddr& mod,
                     const Context& cx) const;
    ast::Stmt onStmt(const ast::Stmt& s, const ModuleAddr& mod,
                     Context& cx) const;
    ast::DefModule onModule(const ast::DefModule& m, Context& cx) const;

    ManipulateRule mRule;
    std::ostream* mDiag = nullptr;
};

} // namespace rnm
