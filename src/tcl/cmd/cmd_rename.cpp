#include <algorithm>
#include <cctype>
#include <sstream>

#include "rnm/rename/engine.hpp"
#include "rnm/tcl/console.hpp"

using rnm::tcl::Console;
using rnm::tcl::Session;

// rename [-v]
static int cmd_rename(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    bool verbose = !a.empty() && a[0] == "-v";
    if (a.size() > (verbose ? 1u : 0u)) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("usage: rename [-v]", -1));
        return TCL_ERROR;
    }
    const auto& cfg = c.session().mConfig;
    rnm::RenameEngine engine(rnm::makeRule(cfg), verbose ? &c.diag() : nullptr);

    // The run composes into a copy so a failing run leaves no snapshot behind
    rnm::RenameLedger ledger = c.ledger();
    size_t before = ledger.size();
    rnm::ast::Circuit out = engine.run(c.circuit(), ledger, cfg.mSkips);

    size_t idx = c.pushSnapshot();
    c.setCircuit(std::move(out));
    c.ledger() = std::move(ledger);

    std::ostringstream oss;
    oss << "renamed with rule " << rnm::to_string(cfg.mRule) << ", circuit "
        << c.circuit().mName << ", " << c.ledger().size() - before
        << " new ledger entries, snapshot " << idx;
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}
static std::vector<std::string> rev_rename(Console& c, const std::string&,
                                           const Console::Args&,
                                           const Session&) {
    return {"restore-snapshot " + std::to_string(c.lastSnapshot())};
}

// restore-snapshot <index>
static int cmd_restore_snapshot(Console& c, Tcl_Interp* ip,
                                const Console::Args& a) {
    bool num = a.size() == 1 && !a[0].empty() &&
               std::all_of(a[0].begin(), a[0].end(), ::isdigit);
    if (!num) {
        Tcl_SetObjResult(
          ip, Tcl_NewStringObj("usage: restore-snapshot <index>", -1));
        return TCL_ERROR;
    }
    if (!c.restoreSnapshot(static_cast<size_t>(std::stoul(a[0])))) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("no such snapshot", -1));
        return TCL_ERROR;
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj("OK", -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_rename(Console& c) {
    c.registerCommand("rename",
                      "Rename the circuit with the session rule and skips: "
                      "rename [-v]",
                      &cmd_rename, nullptr, &rev_rename);
    c.registerCommand("restore-snapshot",
                      "Return to the circuit and ledger saved before a load "
                      "or rename: restore-snapshot <index>",
                      &cmd_restore_snapshot);
}
} // namespace rnm::tcl
