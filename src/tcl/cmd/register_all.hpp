#pragma once
#include "rnm/tcl/console.hpp"

// Declarations of per-file registration
namespace rnm::tcl {
void register_cmd_help(Console& c);    // help/commands
void register_cmd_invert(Console& c);  // invert
void register_cmd_circuit(Console& c); // load/save/list/dump circuit
void register_cmd_skip(Console& c);    // skip/unskip/list-skips
void register_cmd_rule(Console& c);    // set-rule/show-rule
void register_cmd_rename(Console& c);  // rename/restore-snapshot
void register_cmd_ledger(Console& c);  // resolve/dump-ledger/save-ledger
void register_cmd_undo(Console& c);    // undo/redo
void register_cmd_history(Console& c); // history

void register_all_commands(Console& c);
} // namespace rnm::tcl
