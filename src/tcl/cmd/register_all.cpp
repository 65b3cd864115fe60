#include "register_all.hpp"

namespace rnm::tcl {
void register_all_commands(Console& c) {
    register_cmd_help(c);
    register_cmd_invert(c);
    register_cmd_circuit(c);
    register_cmd_skip(c);
    register_cmd_rule(c);
    register_cmd_rename(c);
    register_cmd_ledger(c);
    register_cmd_undo(c);
    register_cmd_history(c);
}
} // namespace rnm::tcl
