#include "rnm/tcl/console.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#ifdef RNM_HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

#include "cmd/register_all.hpp"

namespace rnm::tcl {

Console* Console::sSelf = nullptr;

static inline bool starts_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && std::equal(p.begin(), p.end(), s.begin());
}
static inline std::string lstrip_ws(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
                return !std::isspace(ch);
            }));
    return s;
}
static inline std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok)
        out.push_back(tok);
    return out;
}

Console::Console(std::ostream& diag)
    : mDiag(diag) {}

Console::~Console() {
    if (mInterp) {
        Tcl_DeleteInterp(mInterp);
        mInterp = nullptr;
    }
    if (sSelf == this) sSelf = nullptr;
}

bool Console::init() {
    mInterp = Tcl_CreateInterp();
    if (!mInterp) return false;
    if (Tcl_Init(mInterp) != TCL_OK) {
        error(&mDiag,
              std::string("Tcl_Init failed: ") + Tcl_GetStringResult(mInterp));
        return false;
    }
    registerAllBuiltins();
    return true;
}

void Console::registerAllBuiltins() { register_all_commands(*this); }

void Console::registerCommand(const std::string& name, const std::string& help,
                              Handler handler, Completer completer,
                              ReverseBuilder reverse) {
    mSubcmds[name] = Subcmd{name, help, handler, completer, reverse};
    Tcl_CreateObjCommand(
      mInterp, name.c_str(), &Console::TclCmd, this, nullptr);
}

bool Console::hasCommand(const std::string& name) const {
    return mSubcmds.find(name) != mSubcmds.end();
}

bool Console::isReversible(const std::string& name) const {
    auto it = mSubcmds.find(name);
    return it != mSubcmds.end() && it->second.mReverse != nullptr;
}

std::vector<std::string>
Console::computeReversePlan(const std::string& sub, const Args& args,
                            const Session& pre) const {
    auto it = mSubcmds.find(sub);
    if (it == mSubcmds.end() || !it->second.mReverse) return {};
    // const_cast to allow ReverseBuilder signature receiving Console&
    return it->second.mReverse(const_cast<Console&>(*this), sub, args, pre);
}

std::vector<std::pair<std::string, std::string>>
Console::listCommands() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(mSubcmds.size());
    for (const auto& kv : mSubcmds)
        out.emplace_back(kv.first, kv.second.mHelp);
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    return out;
}

bool Console::getCommandHelp(const std::string& name,
                             std::string& outHelp) const {
    auto it = mSubcmds.find(name);
    if (it == mSubcmds.end()) return false;
    outHelp = it->second.mHelp;
    return true;
}

int Console::evalLine(const std::string& line) {
    if (line.empty()) return 0;
    int code = Tcl_EvalEx(
      mInterp, line.c_str(), static_cast<int>(line.size()), TCL_EVAL_GLOBAL);
    if (code != TCL_OK) {
        mDiag << "Tcl error: " << Tcl_GetStringResult(mInterp) << "\n";
    } else {
        const char* res = Tcl_GetStringResult(mInterp);
        if (res && std::strlen(res) > 0) mDiag << res << "\n";
    }
    return (code == TCL_OK) ? 0 : 1;
}

#ifdef RNM_HAVE_READLINE
char** Console::complt(const char* text, int start, int end) {
    (void)start;
    (void)end;
    Console* self = sSelf;
    if (!self) return nullptr;

    std::string buf(rl_line_buffer ? rl_line_buffer : "");
    auto candidates = self->complete(buf);
    if (candidates.empty()) return nullptr;

    std::string cur(text ? text : "");
    std::vector<char*> arr;
    arr.reserve(candidates.size());
    for (auto& c : candidates)
        if (cur.empty() || starts_with(c, cur))
            arr.push_back(::strdup(c.c_str()));

    if (arr.empty()) return nullptr;

    // readline takes ownership: matches[0] is the substitution text
    char** matches =
      static_cast<char**>(std::malloc((arr.size() + 2) * sizeof(char*)));
    matches[0] = ::strdup(arr.size() == 1 ? arr[0] : cur.c_str());
    for (size_t i = 0; i < arr.size(); ++i)
        matches[i + 1] = arr[i];
    matches[arr.size() + 1] = nullptr;
    return matches;
}
#endif

int Console::repl() {
#ifdef RNM_HAVE_READLINE
    sSelf = this;
    rl_attempted_completion_function = &Console::complt;
#endif
    mDiag << "rnm Tcl console. Type: help\n";
    mDiag << "Press Ctrl+D to exit.\n";
    while (true) {
#ifdef RNM_HAVE_READLINE
        char* line = readline("> ");
        if (!line) break;
        std::string s(line);
        std::free(line);
        s = lstrip_ws(s);
        if (s.empty()) continue;
        add_history(s.c_str());
        (void)evalLine(s);
#else
        std::string s;
        mDiag << "> " << std::flush;
        if (!std::getline(std::cin, s)) break;
        s = lstrip_ws(s);
        if (s.empty()) continue;
        (void)evalLine(s);
#endif
    }
    mDiag << "Bye.\n";
    return 0;
}

int Console::TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                    Tcl_Obj* const objv[]) {
    auto* self = reinterpret_cast<Console*>(cd);
    if (!self) return TCL_ERROR;
    if (objc < 1) return TCL_ERROR;
    std::string cmdName = toStd(objv[0]);
    Args args;
    args.reserve(static_cast<size_t>(std::max(0, objc - 1)));
    for (int i = 1; i < objc; ++i)
        args.push_back(toStd(objv[i]));
    return self->dispatchCommand(interp, cmdName, args);
}

int Console::dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                             const Args& args) {
    auto it = mSubcmds.find(cmdName);
    if (it == mSubcmds.end()) {
        std::string msg = "unknown command: " + cmdName;
        Tcl_SetObjResult(interp, Tcl_NewStringObj(msg.c_str(), -1));
        return TCL_ERROR;
    }
    Session pre = mSession; // snapshot for reverse-builder
    int code = TCL_ERROR;
    try {
        code = it->second.mHandler ? it->second.mHandler(*this, interp, args)
                                   : TCL_ERROR;
    } catch (const std::exception& e) {
        // Rename, config and file errors become Tcl errors
        Tcl_SetObjResult(interp, Tcl_NewStringObj(e.what(), -1));
        code = TCL_ERROR;
    }
    if (code == TCL_OK && !mInReplay && it->second.mReverse) {
        auto undoCmds = it->second.mReverse(*this, cmdName, args, pre);
        if (!undoCmds.empty()) {
            recordUndo(makeCmdLine(cmdName, args), undoCmds, cmdName);
        }
    }
    return code;
}

std::string Console::toStd(Tcl_Obj* obj) {
    int len = 0;
    const char* s = Tcl_GetStringFromObj(obj, &len);
    return std::string(s, static_cast<size_t>(len));
}

std::vector<std::string> Console::complete(const std::string& line) const {
    auto toks = split_words(line);
    const bool endsSpace = (!line.empty() && std::isspace(line.back()));
    if (endsSpace) toks.push_back("");

    // At empty prompt -> list all commands
    if (toks.empty()) return completeCommandNames("");

    // Completing the command name
    if (toks.size() == 1) return completeCommandNames(toks[0]);

    // Command args: delegate to that command's completer
    const std::string& cmd = toks[0];
    auto it = mSubcmds.find(cmd);
    if (it != mSubcmds.end() && it->second.mCompleter)
        return it->second.mCompleter(const_cast<Console&>(*this), toks);
    return {};
}

std::vector<std::string>
Console::completeCommandNames(const std::string& prefix) const {
    std::vector<std::string> r;
    r.reserve(mSubcmds.size());
    for (auto& kv : mSubcmds)
        if (prefix.empty() || starts_with(kv.first, prefix))
            r.push_back(kv.first);
    std::sort(r.begin(), r.end());
    return r;
}

std::string Console::makeCmdLine(const std::string& sub, const Args& args) {
    std::ostringstream oss;
    oss << sub;
    for (const auto& a : args)
        oss << ' ' << a;
    return oss.str();
}

std::vector<std::string>
Console::completeModules(const std::string& prefix) const {
    std::vector<std::string> r;
    if (!mCircuit) return r;
    for (const auto& m : mCircuit->mModules) {
        const auto& name = m.name().str();
        if (prefix.empty() || starts_with(name, prefix)) r.push_back(name);
    }
    std::sort(r.begin(), r.end());
    return r;
}

std::vector<std::string>
Console::completeSkips(const std::string& prefix) const {
    std::vector<std::string> r;
    for (const auto& t : mSession.mConfig.mSkips.sorted()) {
        std::string s = t.toString();
        if (prefix.empty() || starts_with(s, prefix)) r.push_back(s);
    }
    return r;
}

const ast::Circuit& Console::circuit() const {
    if (!mCircuit) throw std::runtime_error("no circuit loaded");
    return *mCircuit;
}

void Console::setCircuit(ast::Circuit c) { mCircuit = std::move(c); }

size_t Console::pushSnapshot() {
    mSnapshots.push_back(Snapshot{mCircuit, mLedger});
    if (mSnapshots.size() > kMaxSnapshots) {
        mSnapshots.pop_front();
        ++mFirstSnapshot;
    }
    return lastSnapshot();
}

bool Console::restoreSnapshot(size_t idx) {
    if (idx < mFirstSnapshot || idx - mFirstSnapshot >= mSnapshots.size())
        return false;
    const Snapshot& snap = mSnapshots[idx - mFirstSnapshot];
    mCircuit = snap.mCircuit;
    mLedger = snap.mLedger;
    return true;
}

// Undo/redo
void Console::recordUndo(const std::string& redoCmd,
                         const std::vector<std::string>& undoCmds,
                         const std::string& label) {
    mUndo.push_back(UndoEntry{redoCmd, undoCmds, label});
    mRedo.clear();
}

int Console::doUndo(Tcl_Interp* ip) {
    if (mUndo.empty()) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("nothing to undo", -1));
        return TCL_OK;
    }
    UndoEntry e = mUndo.back();
    mUndo.pop_back();
    mInReplay = true;
    for (auto& cmd : e.mUndoCmds) {
        int code = Tcl_EvalEx(
          mInterp, cmd.c_str(), static_cast<int>(cmd.size()), TCL_EVAL_GLOBAL);
        if (code != TCL_OK) {
            mInReplay = false;
            std::string msg = "undo failed at: " + cmd +
                              " error: " + Tcl_GetStringResult(mInterp);
            Tcl_SetObjResult(ip, Tcl_NewStringObj(msg.c_str(), -1));
            return TCL_ERROR;
        }
    }
    mInReplay = false;
    mRedo.push_back(e);
    Tcl_SetObjResult(ip, Tcl_NewStringObj("OK", -1));
    return TCL_OK;
}

int Console::doRedo(Tcl_Interp* ip) {
    if (mRedo.empty()) {
        Tcl_SetObjResult(ip, Tcl_NewStringObj("nothing to redo", -1));
        return TCL_OK;
    }
    UndoEntry e = mRedo.back();
    mRedo.pop_back();
    mInReplay = true;
    int code = Tcl_EvalEx(mInterp, e.mRedoCmd.c_str(),
                          static_cast<int>(e.mRedoCmd.size()), TCL_EVAL_GLOBAL);
    mInReplay = false;
    if (code != TCL_OK) {
        std::string msg = "redo failed: " + e.mRedoCmd + " error: " +
                          std::string(Tcl_GetStringResult(mInterp));
        Tcl_SetObjResult(ip, Tcl_NewStringObj(msg.c_str(), -1));
        return TCL_ERROR;
    }
    mUndo.push_back(e);
    Tcl_SetObjResult(ip, Tcl_NewStringObj("OK", -1));
    return TCL_OK;
}

} // namespace rnm::tcl
