#pragma once
// Interactive Tcl console around one circuit, its rename ledger and the
// session settings (rule and skip targets) the next `rename` runs with.

#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tcl.h>

#include "rnm/ast/decl.hpp"
#include "rnm/rename/config.hpp"
#include "rnm/rename/ledger.hpp"

namespace rnm::tcl {

// State the reversible commands change; reverse builders get a copy taken
// before the command ran.
struct Session {
    RenameConfig mConfig;

    bool hasSkip(const Target& t) const { return mConfig.mSkips.contains(t); }
};

// Circuit and ledger as they were before a load or rename.
struct Snapshot {
    std::optional<ast::Circuit> mCircuit;
    RenameLedger mLedger;
};

class Console {
  public:
    using Args = std::vector<std::string>;

    // Function-pointer based handlers to avoid capturing lambdas in the core
    using Handler = int (*)(Console&, Tcl_Interp*, const Args&);
    using Completer = std::vector<std::string> (*)(Console&, const Args&);
    using ReverseBuilder =
      std::vector<std::string> (*)(Console&, const std::string& sub,
                                   const Args& args, const Session& pre);

    struct Subcmd {
        std::string mName;
        std::string mHelp; // one-line description with usage
        Handler mHandler = nullptr;
        Completer mCompleter = nullptr;
        ReverseBuilder mReverse = nullptr;
    };

    struct UndoEntry {
        std::string mRedoCmd;               // forward command line
        std::vector<std::string> mUndoCmds; // reverse command lines
        std::string mLabel;                 // command name
    };

  public:
    explicit Console(std::ostream& diag);
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    bool init();
    int repl();
    // 0 on success; the Tcl result or error goes to the diagnostic stream.
    int evalLine(const std::string& line);

    void registerCommand(const std::string& name, const std::string& help,
                         Handler handler, Completer completer = nullptr,
                         ReverseBuilder reverse = nullptr);

    bool hasCommand(const std::string& name) const;
    bool isReversible(const std::string& name) const;
    std::vector<std::string> computeReversePlan(const std::string& sub,
                                                const Args& args,
                                                const Session& pre) const;

    std::vector<std::pair<std::string, std::string>>
    listCommands() const; // (name, help)
    bool getCommandHelp(const std::string& name, std::string& outHelp) const;

    static std::string makeCmdLine(const std::string& sub, const Args& args);

    std::vector<std::string> completeModules(const std::string& prefix) const;
    std::vector<std::string> completeSkips(const std::string& prefix) const;

    // Circuit and ledger
    bool hasCircuit() const { return mCircuit.has_value(); }
    const ast::Circuit& circuit() const;
    void setCircuit(ast::Circuit c);
    RenameLedger& ledger() { return mLedger; }
    const RenameLedger& ledger() const { return mLedger; }

    // Only the newest snapshots are kept; indices are never reused.
    static constexpr size_t kMaxSnapshots = 32;

    // Saves the current circuit and ledger; returns the snapshot index.
    size_t pushSnapshot();
    // False if `idx` was never taken or has been dropped.
    bool restoreSnapshot(size_t idx);
    // Index of the newest snapshot; only valid after a pushSnapshot().
    size_t lastSnapshot() const {
        return mFirstSnapshot + mSnapshots.size() - 1;
    }
    size_t snapshotCount() const { return mSnapshots.size(); }

    int doUndo(Tcl_Interp* ip);
    int doRedo(Tcl_Interp* ip);

    Tcl_Interp* interp() const { return mInterp; }
    Session& session() { return mSession; }
    const Session& session() const { return mSession; }
    std::ostream& diag() { return mDiag; }

    // Implemented in src/tcl/cmd/register_all.cpp
    void registerAllBuiltins();
#ifdef RNM_HAVE_READLINE
    static char** complt(const char* text, int start, int end);
#endif
    static Console* sSelf;

  private:
    // Tcl entrypoint for all top-level commands
    static int TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                      Tcl_Obj* const objv[]);
    int dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                        const Args& args);

    static std::string toStd(Tcl_Obj* obj);
    std::vector<std::string> complete(const std::string& line) const;
    std::vector<std::string>
    completeCommandNames(const std::string& prefix) const;

    void recordUndo(const std::string& redoCmd,
                    const std::vector<std::string>& undoCmds,
                    const std::string& label);

  private:
    Tcl_Interp* mInterp = nullptr;
    std::unordered_map<std::string, Subcmd> mSubcmds;

    std::optional<ast::Circuit> mCircuit;
    RenameLedger mLedger;
    Session mSession;
    std::deque<Snapshot> mSnapshots;
    size_t mFirstSnapshot = 0; // index of mSnapshots.front()
    std::ostream& mDiag;

    std::vector<UndoEntry> mUndo;
    std::vector<UndoEntry> mRedo;
    bool mInReplay = false; // avoid re-recording when running undo/redo
};

} // namespace rnm::tcl
