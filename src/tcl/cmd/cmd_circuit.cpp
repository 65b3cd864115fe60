#include <sstream>

#include "rnm/tcl/console.hpp"
#include "rnm/vis/json.hpp"

using rnm::tcl::Console;
using rnm::tcl::Session;

static int set_result(Tcl_Interp* ip, const std::string& s, int code) {
    Tcl_SetObjResult(ip, Tcl_NewStringObj(s.c_str(), -1));
    return code;
}

// load-circuit <file.json>
static int cmd_load_circuit(Console& c, Tcl_Interp* ip,
                            const Console::Args& a) {
    if (a.size() != 1)
        return set_result(ip, "usage: load-circuit <file.json>", TCL_ERROR);
    rnm::ast::Circuit loaded =
      rnm::vis::circuitFromJson(rnm::vis::readJsonFile(a[0]));
    size_t idx = c.pushSnapshot();
    c.setCircuit(std::move(loaded));
    c.ledger().clear();
    std::ostringstream oss;
    oss << "loaded circuit " << c.circuit().mName << " ("
        << c.circuit().mModules.size() << " modules), snapshot " << idx;
    return set_result(ip, oss.str(), TCL_OK);
}
static std::vector<std::string> rev_load_circuit(Console& c,
                                                 const std::string&,
                                                 const Console::Args&,
                                                 const Session&) {
    return {"restore-snapshot " + std::to_string(c.lastSnapshot())};
}

// save-circuit <file.json>
static int cmd_save_circuit(Console& c, Tcl_Interp* ip,
                            const Console::Args& a) {
    if (a.size() != 1)
        return set_result(ip, "usage: save-circuit <file.json>", TCL_ERROR);
    rnm::vis::writeJsonFile(a[0], rnm::vis::circuitToJson(c.circuit()));
    return set_result(ip, "wrote " + a[0], TCL_OK);
}

static int cmd_list_modules(Console& c, Tcl_Interp* ip,
                            const Console::Args&) {
    const auto& circ = c.circuit();
    std::ostringstream oss;
    oss << "circuit " << circ.mName << " (top " << circ.mTop << ")";
    for (const auto& m : circ.mModules) {
        oss << "\n  " << (m.isExternal() ? "extmodule " : "module ")
            << m.name() << " [" << m.ports().size() << " ports]";
    }
    return set_result(ip, oss.str(), TCL_OK);
}

// dump-circuit [module]
static int cmd_dump_circuit(Console& c, Tcl_Interp* ip,
                            const Console::Args& a) {
    const auto& circ = c.circuit();
    std::ostringstream oss;
    if (a.empty()) {
        rnm::ast::dumpCircuit(circ, oss);
    } else {
        const auto* m = circ.findModule(rnm::IdString::tryLookup(a[0]));
        if (!m) return set_result(ip, "unknown module: " + a[0], TCL_ERROR);
        rnm::ast::dumpModule(*m, oss);
    }
    return set_result(ip, oss.str(), TCL_OK);
}
static std::vector<std::string> compl_module(Console& c,
                                             const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completeModules(toks[1]);
}

namespace rnm::tcl {
void register_cmd_circuit(Console& c) {
    c.registerCommand("load-circuit",
                      "Load a circuit from JSON and clear the ledger: "
                      "load-circuit <file.json>",
                      &cmd_load_circuit, nullptr, &rev_load_circuit);
    c.registerCommand("save-circuit",
                      "Write the circuit as JSON: save-circuit <file.json>",
                      &cmd_save_circuit);
    c.registerCommand("list-modules", "List the circuit's modules: list-modules",
                      &cmd_list_modules);
    c.registerCommand("dump-circuit",
                      "Print the circuit or one module: dump-circuit [module]",
                      &cmd_dump_circuit, &compl_module);
}
} // namespace rnm::tcl
