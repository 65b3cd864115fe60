#include <sstream>

#ifdef RNM_HAVE_READLINE
#include <readline/history.h>
#endif

#include "rnm/tcl/console.hpp"

using rnm::tcl::Console;

static int cmd_history(Console&, Tcl_Interp* ip, const Console::Args&) {
    std::ostringstream oss;
#ifdef RNM_HAVE_READLINE
    HIST_ENTRY** list = history_list();
    if (list) {
        for (int i = 0; list[i]; i++)
            oss << i + history_base << ": " << list[i]->line << "\n";
    }
#else
    oss << "history needs readline";
#endif
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_history(Console& c) {
    c.registerCommand("history", "List the entered command lines: history",
                      &cmd_history);
}
} // namespace rnm::tcl
