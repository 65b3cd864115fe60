#include "rnm/tcl/console.hpp"

using rnm::tcl::Console;

static int cmd_undo(Console& c, Tcl_Interp* ip, const Console::Args&) {
    return c.doUndo(ip);
}
static int cmd_redo(Console& c, Tcl_Interp* ip, const Console::Args&) {
    return c.doRedo(ip);
}

namespace rnm::tcl {
void register_cmd_undo(Console& c) {
    c.registerCommand("undo", "Undo the last undoable command: undo", &cmd_undo);
    c.registerCommand("redo", "Redo the last undone command: redo", &cmd_redo);
}
} // namespace rnm::tcl
