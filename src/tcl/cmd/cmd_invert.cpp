#include <sstream>

#include "rnm/tcl/console.hpp"

using rnm::tcl::Console;

// invert <cmd> [args...]: what undo would run after <cmd> from this state
static int cmd_invert(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        Tcl_SetObjResult(
          ip, Tcl_NewStringObj("usage: invert <cmd> [args...]", -1));
        return TCL_ERROR;
    }
    if (!c.hasCommand(a[0])) {
        Tcl_SetObjResult(
          ip, Tcl_NewStringObj(("unknown command: " + a[0]).c_str(), -1));
        return TCL_ERROR;
    }
    Console::Args args(a.begin() + 1, a.end());
    auto plan = c.computeReversePlan(a[0], args, c.session());
    if (plan.empty()) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("<none>", -1));
        return TCL_OK;
    }
    std::ostringstream oss;
    for (auto& l : plan)
        oss << l << "\n";
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_invert(Console& c) {
    c.registerCommand("invert",
                      "Show the reverse command(s): invert <cmd> [args...]",
                      &cmd_invert);
}
} // namespace rnm::tcl
