#include <sstream>

#include "rnm/tcl/console.hpp"

using rnm::tcl::Console;
using rnm::tcl::Session;

// skip <target>
static int cmd_skip(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("usage: skip <target>", -1));
        return TCL_ERROR;
    }
    rnm::Target t = rnm::parseTarget(a[0]);
    c.session().mConfig.mSkips.add(t);
    Tcl_SetObjResult(ip, Tcl_NewStringObj(t.toString().c_str(), -1));
    return TCL_OK;
}
static std::vector<std::string> rev_skip(Console&, const std::string&,
                                         const Console::Args& a,
                                         const Session& pre) {
    if (a.size() != 1) return {};
    rnm::Target t = rnm::parseTarget(a[0]);
    if (pre.hasSkip(t)) return {};
    return {"unskip " + t.toString()};
}

// unskip <target>
static int cmd_unskip(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() != 1) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("usage: unskip <target>", -1));
        return TCL_ERROR;
    }
    if (!c.session().mConfig.mSkips.remove(rnm::parseTarget(a[0]))) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("target not skipped", -1));
        return TCL_ERROR;
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj("OK", -1));
    return TCL_OK;
}
static std::vector<std::string> rev_unskip(Console&, const std::string&,
                                           const Console::Args& a,
                                           const Session& pre) {
    if (a.size() != 1) return {};
    rnm::Target t = rnm::parseTarget(a[0]);
    if (!pre.hasSkip(t)) return {};
    return {"skip " + t.toString()};
}
static std::vector<std::string> compl_unskip(Console& c,
                                             const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completeSkips(toks[1]);
}

static int cmd_list_skips(Console& c, Tcl_Interp* ip, const Console::Args&) {
    std::ostringstream oss;
    for (const auto& t : c.session().mConfig.mSkips.sorted())
        oss << t << "\n";
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_skip(Console& c) {
    c.registerCommand("skip",
                      "Leave a local target untouched by rename: skip <target>",
                      &cmd_skip, nullptr, &rev_skip);
    c.registerCommand("unskip", "Drop a skip target: unskip <target>",
                      &cmd_unskip, &compl_unskip, &rev_unskip);
    c.registerCommand("list-skips", "List skip targets: list-skips",
                      &cmd_list_skips);
}
} // namespace rnm::tcl
