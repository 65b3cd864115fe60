#include <sstream>

#include "rnm/tcl/console.hpp"
#include "rnm/vis/json.hpp"

using rnm::tcl::Console;

// resolve <target>
static int cmd_resolve(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("usage: resolve <target>", -1));
        return TCL_ERROR;
    }
    rnm::Target t = rnm::parseTarget(a[0]);
    const auto* images = c.ledger().get(t);
    std::ostringstream oss;
    if (!images) {
        oss << t << " (not renamed)";
    } else {
        for (size_t i = 0; i < images->size(); ++i)
            oss << (i ? "\n" : "") << (*images)[i];
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

static int cmd_dump_ledger(Console& c, Tcl_Interp* ip, const Console::Args&) {
    std::ostringstream oss;
    for (const auto& [from, images] : c.ledger().entries()) {
        oss << from << " ->";
        for (const auto& t : images)
            oss << " " << t;
        oss << "\n";
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

// save-ledger <file.json>
static int cmd_save_ledger(Console& c, Tcl_Interp* ip,
                           const Console::Args& a) {
    if (a.size() != 1) {
        Tcl_SetObjResult(ip,
                         Tcl_NewStringObj("usage: save-ledger <file.json>", -1));
        return TCL_ERROR;
    }
    rnm::vis::writeJsonFile(a[0], rnm::vis::ledgerToJson(c.ledger()));
    Tcl_SetObjResult(ip, Tcl_NewStringObj(("wrote " + a[0]).c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_ledger(Console& c) {
    c.registerCommand("resolve",
                      "Show what a target was renamed to: resolve <target>",
                      &cmd_resolve);
    c.registerCommand("dump-ledger", "Print all recorded renames: dump-ledger",
                      &cmd_dump_ledger);
    c.registerCommand("save-ledger",
                      "Write the ledger as JSON: save-ledger <file.json>",
                      &cmd_save_ledger);
}
} // namespace rnm::tcl
