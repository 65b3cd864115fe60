#include "rnm/tcl/console.hpp"

#include <algorithm>
#include <sstream>

using rnm::tcl::Console;

// Edit distance for "did you mean" suggestions
static size_t lev(const std::string& a, const std::string& b) {
    const size_t n = a.size(), m = b.size();
    std::vector<size_t> prev(m + 1), cur(m + 1);
    for (size_t j = 0; j <= m; ++j)
        prev[j] = j;
    for (size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= m; ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] =
              std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[m];
}

static std::string render_list(const Console& c) {
    auto list = c.listCommands();
    size_t w = 0;
    for (auto& p : list)
        w = std::max(w, p.first.size());
    std::ostringstream oss;
    oss << "commands (* = undoable):\n";
    for (auto& p : list) {
        oss << (c.isReversible(p.first) ? "* " : "  ") << p.first
            << std::string(w - p.first.size(), ' ') << " - " << p.second
            << "\n";
    }
    return oss.str();
}

static std::vector<std::string> suggest(const Console& c,
                                        const std::string& name) {
    std::vector<std::pair<size_t, std::string>> cand;
    for (auto& p : c.listCommands()) {
        size_t d = lev(name, p.first);
        if (d <= 3 || p.first.rfind(name, 0) == 0) cand.emplace_back(d, p.first);
    }
    std::stable_sort(cand.begin(), cand.end(), [](auto& x, auto& y) {
        return x.first < y.first;
    });
    std::vector<std::string> out;
    for (auto& kv : cand) {
        out.push_back(kv.second);
        if (out.size() >= 5) break;
    }
    return out;
}

static int cmd_help(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj(render_list(c).c_str(), -1));
        return TCL_OK;
    }
    const std::string& name = a[0];
    std::string help;
    std::ostringstream oss;
    if (c.getCommandHelp(name, help)) {
        oss << name << " - " << help;
        if (c.isReversible(name)) oss << " (undoable)";
        Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
        return TCL_OK;
    }
    oss << "unknown command: " << name;
    auto near = suggest(c, name);
    if (near.empty()) {
        oss << " (no close matches)";
    } else {
        oss << "\ndid you mean:";
        for (auto& n : near)
            oss << "\n  " << n;
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_ERROR;
}

static std::vector<std::string> compl_help(Console& c,
                                           const Console::Args& toks) {
    // tokens: ["help", "<partial>"]
    if (toks.size() != 2) return {};
    std::vector<std::string> out;
    for (auto& p : c.listCommands())
        if (toks[1].empty() || p.first.rfind(toks[1], 0) == 0)
            out.push_back(p.first);
    return out;
}

static int cmd_commands(Console& c, Tcl_Interp* ip, const Console::Args&) {
    Tcl_SetObjResult(ip, Tcl_NewStringObj(render_list(c).c_str(), -1));
    return TCL_OK;
}

namespace rnm::tcl {
void register_cmd_help(Console& c) {
    c.registerCommand("help",
                      "Show help for all commands or one: help [name]",
                      &cmd_help,
                      &compl_help);
    c.registerCommand(
      "commands", "List commands with one-line help: commands", &cmd_commands);
}
} // namespace rnm::tcl
