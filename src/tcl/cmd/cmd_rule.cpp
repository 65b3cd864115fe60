#include <sstream>

#include "rnm/tcl/console.hpp"

using rnm::RenameConfig;
using rnm::RuleKind;
using rnm::tcl::Console;
using rnm::tcl::Session;

// Arguments of set-rule that reproduce `cfg`'s rule
static std::string rule_args(const RenameConfig& cfg) {
    std::string s = rnm::to_string(cfg.mRule);
    if (cfg.mRule == RuleKind::Prefix) s += " " + cfg.mPrefix;
    if (cfg.mRule == RuleKind::Keywords)
        for (const auto& k : cfg.mKeywords)
            s += " " + k;
    return s;
}

// set-rule verilog|lower|upper | prefix <p> | keywords <kw...>
static int cmd_set_rule(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    auto usage = [&]() {
        Tcl_SetObjResult(
          ip, Tcl_NewStringObj("usage: set-rule verilog|lower|upper | "
                               "prefix <p> | keywords <kw...>",
                               -1));
        return TCL_ERROR;
    };
    if (a.empty()) return usage();
    auto kind = rnm::parseRuleKind(a[0]);
    if (!kind) return usage();

    RenameConfig next = c.session().mConfig;
    next.mRule = *kind;
    next.mPrefix.clear();
    next.mKeywords.clear();
    if (*kind == RuleKind::Prefix) {
        if (a.size() != 2) return usage();
        next.mPrefix = a[1];
    } else if (*kind == RuleKind::Keywords) {
        if (a.size() < 2) return usage();
        next.mKeywords.assign(a.begin() + 1, a.end());
    } else if (a.size() != 1) {
        return usage();
    }
    (void)rnm::makeRule(next); // validates the parameters
    c.session().mConfig = std::move(next);
    Tcl_SetObjResult(
      ip, Tcl_NewStringObj(rule_args(c.session().mConfig).c_str(), -1));
    return TCL_OK;
}
static std::vector<std::string> rev_set_rule(Console&, const std::string&,
                                             const Console::Args&,
                                             const Session& pre) {
    return {"set-rule " + rule_args(pre.mConfig)};
}
static std::vector<std::string> compl_set_rule(Console&,
                                               const Console::Args& toks) {
    if (toks.size() != 2) return {};
    std::vector<std::string> out;
    for (const char* k : {"keywords", "lower", "prefix", "upper", "verilog"})
        if (std::string(k).rfind(toks[1], 0) == 0) out.push_back(k);
    return out;
}

static int cmd_show_rule(Console& c, Tcl_Interp* ip, const Console::Args&) {
    std::string s = rnm::renameConfigToJson(c.session().mConfig).dump(2);
    Tcl_SetObjResult(ip, Tcl_NewStringObj(s.c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_rule(Console& c) {
    c.registerCommand("set-rule",
                      "Choose the rename rule: set-rule verilog|lower|upper | "
                      "prefix <p> | keywords <kw...>",
                      &cmd_set_rule, &compl_set_rule, &rev_set_rule);
    c.registerCommand("show-rule", "Print the rule and skips as JSON: show-rule",
                      &cmd_show_rule);
}
} // namespace rnm::tcl
