#include <iostream>

#include "rnm/ast/decl.hpp"
#include "rnm/tcl/console.hpp"
#include "rnm/vis/json.hpp"

using namespace rnm;
using namespace rnm::ast;
using rnm::tcl::Console;

static Port p(const char* name, PortDirection dir, Type t = Type::uintOf(1)) {
    return Port{IdString(name), dir, t};
}
static Stmt connectStmt(Expr loc, Expr e) {
    return Stmt(ConnectStmt{std::move(loc), std::move(e)});
}

// Small circuit whose names collide with Verilog keywords, so `rename` with
// the default rule has something to do.
static Circuit demoCircuit() {
    Module leaf{IdString("Leaf"),
                {p("clock", PortDirection::In, Type::clock()),
                 p("input_", PortDirection::In, Type::uintOf(8)),
                 p("wire", PortDirection::Out, Type::uintOf(8))},
                {}};
    leaf.mBody.push_back(Stmt(RegDecl{IdString("reg"), Type::uintOf(8),
                                      Expr::ref("clock"), std::nullopt,
                                      std::nullopt}));
    leaf.mBody.push_back(connectStmt(Expr::ref("reg"), Expr::ref("input_")));
    leaf.mBody.push_back(connectStmt(Expr::ref("wire"), Expr::ref("reg")));

    Module top{IdString("Top"),
               {p("clock", PortDirection::In, Type::clock()),
                p("in", PortDirection::In, Type::uintOf(8)),
                p("out", PortDirection::Out, Type::uintOf(8))},
               {}};
    MemDecl mem;
    mem.mName = IdString("table");
    mem.mDataType = Type::uintOf(8);
    mem.mDepth = 16;
    mem.mReaders = {IdString("read")};
    mem.mWriters = {IdString("write")};
    top.mBody.push_back(Stmt(InstanceDecl{IdString("module"), IdString("Leaf")}));
    top.mBody.push_back(Stmt(std::move(mem)));
    top.mBody.push_back(
      connectStmt(Expr::ref("module").field("clock"), Expr::ref("clock")));
    top.mBody.push_back(
      connectStmt(Expr::ref("module").field("input_"), Expr::ref("in")));
    top.mBody.push_back(
      connectStmt(Expr::ref("table").field("read").field("addr"),
              Expr::prim(PrimOp::Bits, {Expr::ref("in")}, {3, 0})));
    top.mBody.push_back(
      connectStmt(Expr::ref("out"), Expr::ref("module").field("wire")));

    return Circuit::make(IdString("Top"),
                         {DefModule(std::move(leaf)), DefModule(std::move(top))});
}

int main(int argc, char** argv) {
    Console console(std::cerr);
    if (!console.init()) {
        std::cerr << "Failed to init Tcl console\n";
        return 1;
    }
    try {
        if (argc > 1) {
            console.setCircuit(vis::circuitFromJson(vis::readJsonFile(argv[1])));
        } else {
            console.setCircuit(demoCircuit());
        }
    } catch (const std::exception& e) {
        error(&std::cerr, e.what());
        return 1;
    }
    return console.repl();
}
