#include <sstream>

#include <gtest/gtest.h>

#include "rnm/rename/engine.hpp"
#include "rnm/rename/rules.hpp"
#include "test_util.hpp"

using namespace rnm;
using namespace rnm::test;

// Circuit Foo: module Bar (empty) instantiated twice from the top module Foo.
// Bar is declared first; Foo references it.
static Circuit fooBar() {
    return Circuit::make(IdString("Foo"),
                         {mod("Bar", {}, {}),
                          mod("Foo", {},
                              {inst("bar", "Bar"), inst("bar2", "Bar")})});
}

static Circuit runWith(const Circuit& c, ManipulateRule rule,
                       RenameLedger& ledger, const SkipSet& skips = {}) {
    RenameEngine engine(std::move(rule));
    return engine.run(c, ledger, skips);
}

static const InstanceDecl& instNamed(const Circuit& c, const char* module,
                                     const char* name) {
    return declNamed(moduleNamed(c, module), name).as<InstanceDecl>();
}

static std::string bodyText(const Circuit& c, const char* module) {
    std::ostringstream os;
    dumpModule(moduleNamed(c, module), os);
    return os.str();
}

TEST(RenameEngine, SingleModuleCircuit) {
    Circuit c = Circuit::make(IdString("Foo"), {mod("Foo", {}, {})});
    RenameLedger ledger;
    Circuit res = runWith(c, makePrefixRule("pfx_"), ledger);
    EXPECT_EQ(res.mName, IdString("pfx_Foo"));
    EXPECT_EQ(res.mTop, IdString("pfx_Foo"));
    EXPECT_EQ(moduleNames(res), (std::vector<std::string>{"pfx_Foo"}));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo")), parseTarget("~pfx_Foo"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Foo")),
              parseTarget("~pfx_Foo|pfx_Foo"));
}

TEST(RenameEngine, SharedModuleRenamedOnce) {
    RenameLedger ledger;
    Circuit res = runWith(fooBar(), makePrefixRule("pfx_"), ledger);
    EXPECT_EQ(res.mName, IdString("pfx_Foo"));
    // Declaration order is kept
    EXPECT_EQ(moduleNames(res),
              (std::vector<std::string>{"pfx_Bar", "pfx_Foo"}));

    const auto& bar = instNamed(res, "pfx_Foo", "pfx_bar");
    const auto& bar2 = instNamed(res, "pfx_Foo", "pfx_bar2");
    EXPECT_EQ(bar.mModule, IdString("pfx_Bar"));
    EXPECT_EQ(bar2.mModule, IdString("pfx_Bar"));

    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Bar")),
              parseTarget("~pfx_Foo|pfx_Bar"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Foo/bar:Bar")),
              parseTarget("~pfx_Foo|pfx_Foo/pfx_bar:pfx_Bar"));
    EXPECT_EQ(ledger.size(), 5u);
}

TEST(RenameEngine, CircuitSkipLeavesEverything) {
    Circuit orig = fooBar();
    RenameLedger ledger;
    Circuit res = runWith(orig, makePrefixRule("pfx_"), ledger,
                          SkipSet{parseTarget("~Foo")});
    EXPECT_EQ(circuitToString(res), circuitToString(orig));
    EXPECT_TRUE(ledger.empty());
}

TEST(RenameEngine, TopModuleSkipKeepsOnlyItsName) {
    RenameLedger ledger;
    Circuit res = runWith(fooBar(), makePrefixRule("pfx_"), ledger,
                          SkipSet{parseTarget("~Foo|Foo")});
    EXPECT_EQ(res.mName, IdString("pfx_Foo"));
    EXPECT_EQ(res.mTop, IdString("Foo"));
    EXPECT_EQ(moduleNames(res), (std::vector<std::string>{"pfx_Bar", "Foo"}));
    EXPECT_EQ(instNamed(res, "Foo", "pfx_bar").mModule, IdString("pfx_Bar"));
    EXPECT_EQ(ledger.get(parseTarget("~Foo|Foo")), nullptr);
}

TEST(RenameEngine, InstanceSkip) {
    RenameLedger ledger;
    Circuit res = runWith(fooBar(), makePrefixRule("pfx_"), ledger,
                          SkipSet{parseTarget("~Foo|Foo/bar:Bar")});
    EXPECT_EQ(instNamed(res, "pfx_Foo", "bar").mModule, IdString("pfx_Bar"));
    EXPECT_EQ(instNamed(res, "pfx_Foo", "pfx_bar2").mModule,
              IdString("pfx_Bar"));
    EXPECT_EQ(ledger.get(parseTarget("~Foo|Foo/bar:Bar")), nullptr);
}

TEST(RenameEngine, RuleDeclinesEverything) {
    Circuit orig = fooBar();
    RenameLedger ledger;
    ManipulateRule keep = [](const std::string&,
                             Namespace&) -> std::optional<std::string> {
        return std::nullopt;
    };
    Circuit res = runWith(orig, keep, ledger);
    EXPECT_EQ(circuitToString(res), circuitToString(orig));
    EXPECT_TRUE(ledger.empty());

    // A rule returning the same name is also a no-op
    ManipulateRule same = [](const std::string& n,
                             Namespace&) -> std::optional<std::string> {
        return n;
    };
    res = runWith(orig, same, ledger);
    EXPECT_EQ(circuitToString(res), circuitToString(orig));
    EXPECT_TRUE(ledger.empty());
}

TEST(RenameEngine, NewNamesAvoidExistingOnes) {
    Circuit c = Circuit::make(IdString("M"),
                              {mod("M", {in("a"), in("x_a")},
                                   {node("n", Expr::ref("a"))})});
    RenameLedger ledger;
    Circuit res = runWith(c, makePrefixRule("x_"), ledger);
    EXPECT_EQ(portNames(moduleNamed(res, "x_M")),
              (std::vector<std::string>{"x_a_0", "x_x_a"}));
    EXPECT_NE(bodyText(res, "x_M").find("node x_n = x_a_0"),
              std::string::npos);
}

// Child with two ports, instantiated from Top next to a memory.
static Circuit childAndMemory() {
    Circuit c = Circuit::make(
      IdString("Top"),
      {mod("Child", {in("in"), out("out")},
           {connect(Expr::ref("out"), Expr::ref("in"))}),
       mod("Top", {in("clk", Type::clock()), in("din"), out("dout")},
           {inst("c", "Child"), mem("m", {"r"}, {"w"}),
            connect(Expr::ref("c").field("in"),
                    Expr::ref("m").field("r").field("data")),
            connect(Expr::ref("m").field("r").field("addr"), Expr::ref("din")),
            Stmt(WhenStmt{Expr::ref("din"),
                          {node("t", Expr::ref("c").field("out")),
                           connect(Expr::ref("m").field("w").field("data"),
                                   Expr::ref("t"))},
                          {invalid(Expr::ref("m").field("w").field("en"))}}),
            connect(Expr::ref("dout"),
                    Expr::mux(Expr::ref("din"), Expr::ref("c").field("out"),
                              Expr::literal(0, 1)))})});
    return c;
}

TEST(RenameEngine, UseSitesFollowDeclarations) {
    RenameLedger ledger;
    Circuit res = runWith(childAndMemory(), makePrefixRule("x_"), ledger);
    EXPECT_EQ(res.mTop, IdString("x_Top"));

    std::string child = bodyText(res, "x_Child");
    EXPECT_NE(child.find("x_out <= x_in"), std::string::npos) << child;

    std::string top = bodyText(res, "x_Top");
    EXPECT_NE(top.find("inst x_c of x_Child"), std::string::npos) << top;
    EXPECT_NE(top.find("reader => x_r"), std::string::npos) << top;
    EXPECT_NE(top.find("writer => x_w"), std::string::npos) << top;
    EXPECT_NE(top.find("x_c.x_in <= x_m.x_r.data"), std::string::npos) << top;
    EXPECT_NE(top.find("x_m.x_r.addr <= x_din"), std::string::npos) << top;
    EXPECT_NE(top.find("when x_din :"), std::string::npos) << top;
    EXPECT_NE(top.find("node x_t = x_c.x_out"), std::string::npos) << top;
    EXPECT_NE(top.find("x_m.x_w.data <= x_t"), std::string::npos) << top;
    EXPECT_NE(top.find("x_m.x_w.en is invalid"), std::string::npos) << top;
    EXPECT_NE(top.find("x_dout <= mux(x_din, x_c.x_out, UInt<1>(0))"),
              std::string::npos)
      << top;

    EXPECT_EQ(ledger.resolve(parseTarget("~Top|Child>in")),
              parseTarget("~x_Top|x_Child>x_in"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Top|Top>m.r")),
              parseTarget("~x_Top|x_Top>x_m.x_r"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Top|Top/c:Child")),
              parseTarget("~x_Top|x_Top/x_c:x_Child"));
}

TEST(RenameEngine, SkipIsLocalToItsAddress) {
    // Bar's port and Foo's wire share the name `out`
    Circuit c = Circuit::make(
      IdString("Foo"),
      {mod("Bar", {out("out")}, {}),
       mod("Foo", {}, {inst("bar", "Bar"), wire("out"),
                       connect(Expr::ref("out"), Expr::ref("bar").field("out"))})});
    RenameLedger ledger;
    Circuit res = runWith(c, makePrefixRule("pfx_"), ledger,
                          SkipSet{parseTarget("~Foo|Bar>out")});
    EXPECT_EQ(portNames(moduleNamed(res, "pfx_Bar")),
              (std::vector<std::string>{"out"}));
    std::string foo = bodyText(res, "pfx_Foo");
    EXPECT_NE(foo.find("wire pfx_out"), std::string::npos) << foo;
    EXPECT_NE(foo.find("pfx_out <= pfx_bar.out"), std::string::npos) << foo;
}

TEST(RenameEngine, ExternalModulePortsKeepTheirNames) {
    Circuit c = Circuit::make(
      IdString("Top"),
      {extModule("Ext", {out("OuT")}),
       mod("Top", {}, {inst("e", "Ext"), node("n", Expr::ref("e").field("OuT"))})});
    RenameLedger ledger;
    Circuit res = runWith(c, makePrefixRule("pfx_"), ledger);
    const auto& ext = moduleNamed(res, "pfx_Ext");
    ASSERT_TRUE(ext.isExternal());
    EXPECT_EQ(portNames(ext), (std::vector<std::string>{"OuT"}));
    EXPECT_EQ(ext.as<ExtModule>().mDefName, "Ext");

    std::string top = bodyText(res, "pfx_Top");
    EXPECT_NE(top.find("inst pfx_e of pfx_Ext"), std::string::npos) << top;
    EXPECT_NE(top.find("node pfx_n = pfx_e.OuT"), std::string::npos) << top;
    EXPECT_EQ(ledger.get(parseTarget("~Top|Ext>OuT")), nullptr);
    EXPECT_EQ(ledger.resolve(parseTarget("~Top|Ext")),
              parseTarget("~pfx_Top|pfx_Ext"));
}

TEST(RenameEngine, MemoryPortFieldsAreNeverRenamed) {
    Circuit c = Circuit::make(
      IdString("t"),
      {mod("t", {in("a", Type::uintOf(5))},
           {mem("m", {"r"}, {}),
            connect(Expr::ref("m").field("r").field("addr"), Expr::ref("a"))})});
    RenameLedger ledger;
    Circuit res = runWith(c, makeUpperCaseRule(), ledger);
    std::string body = bodyText(res, "T");
    EXPECT_NE(body.find("M.R.addr <= A"), std::string::npos) << body;
}

TEST(RenameEngine, UnknownSubfieldBaseFailsTheRun) {
    Circuit c = Circuit::make(
      IdString("Foo"),
      {mod("Foo", {}, {wire("w"), node("n", Expr::ref("w").field("x"))})});
    RenameLedger ledger;
    ledger.record(parseTarget("~Old|Old"), parseTarget("~Foo|Foo"));
    try {
        runWith(c, makePrefixRule("pfx_"), ledger);
        FAIL() << "expected InternalError";
    } catch (const InternalError& e) {
        EXPECT_NE(std::string(e.what()).find("neither an instance nor a memory"),
                  std::string::npos);
    }
    // Nothing of the failed run is visible
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_EQ(ledger.resolve(parseTarget("~Old|Old")), parseTarget("~Foo|Foo"));
}

TEST(RenameEngine, InstancePortFieldIsUnexpectedShape) {
    Circuit c = Circuit::make(
      IdString("Foo"),
      {mod("Bar", {out("o")}, {}),
       mod("Foo", {}, {inst("b", "Bar"),
                       node("n", Expr::ref("b").field("o").field("x"))})});
    RenameLedger ledger;
    EXPECT_THROW(runWith(c, makePrefixRule("pfx_"), ledger), InternalError);
    EXPECT_TRUE(ledger.empty());
}

TEST(RenameEngine, SuccessiveRunsCompose) {
    RenameLedger ledger;
    Circuit once = runWith(fooBar(), makePrefixRule("a_"), ledger);
    Circuit twice = runWith(once, makePrefixRule("b_"), ledger);
    EXPECT_EQ(twice.mName, IdString("b_a_Foo"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Bar")),
              parseTarget("~b_a_Foo|b_a_Bar"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Foo/bar:Bar")),
              parseTarget("~b_a_Foo|b_a_Foo/b_a_bar:b_a_Bar"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo")), parseTarget("~b_a_Foo"));
}

TEST(RenameEngine, LaterRunRenamingOnlyScopesKeepsEarlierImages) {
    Circuit c = Circuit::make(
      IdString("Foo"), {mod("Foo", {}, {wire("x"), mem("m", {"r"}, {})})});
    RenameLedger ledger;
    Circuit once = runWith(c, makeKeywordRule({"x", "r"}), ledger);
    Circuit twice = runWith(once, makeKeywordRule({"Foo", "m"}), ledger);

    EXPECT_EQ(twice.mName, IdString("Foo_"));
    EXPECT_EQ(moduleNames(twice), (std::vector<std::string>{"Foo_"}));
    std::string body = bodyText(twice, "Foo_");
    EXPECT_NE(body.find("wire x_ :"), std::string::npos) << body;
    EXPECT_NE(body.find("mem m_ :"), std::string::npos) << body;
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Foo>x")),
              parseTarget("~Foo_|Foo_>x_"));
    EXPECT_EQ(ledger.resolve(parseTarget("~Foo|Foo>m.r")),
              parseTarget("~Foo_|Foo_>m_.r_"));
}

TEST(RenameEngine, ModuleNamesStayDistinct) {
    Circuit c = Circuit::make(
      IdString("top"),
      {mod("foo", {out("o")}, {}), mod("Foo", {out("o")}, {}),
       mod("top", {}, {inst("a", "Foo"), inst("b", "foo")})});
    RenameLedger ledger;
    Circuit res = runWith(c, makeLowerCaseRule(), ledger);
    EXPECT_EQ(moduleNames(res),
              (std::vector<std::string>{"foo", "foo_0", "top"}));
    EXPECT_EQ(instNamed(res, "top", "a").mModule, IdString("foo_0"));
    EXPECT_EQ(instNamed(res, "top", "b").mModule, IdString("foo"));
    EXPECT_EQ(ledger.resolve(parseTarget("~top|Foo")),
              parseTarget("~top|foo_0"));
}

TEST(RenameEngine, VerboseLog) {
    std::ostringstream diag;
    RenameLedger ledger;
    RenameEngine engine(makePrefixRule("pfx_"), &diag);
    engine.run(fooBar(), ledger, SkipSet{parseTarget("~Foo|Foo/bar:Bar")});
    std::string log = diag.str();
    EXPECT_NE(log.find("INFO: module Bar"), std::string::npos) << log;
    EXPECT_NE(log.find("INFO: ~Foo|Bar -> ~pfx_Foo|pfx_Bar"), std::string::npos)
      << log;
    EXPECT_NE(log.find("INFO: skip ~Foo|Foo/bar:Bar"), std::string::npos)
      << log;
    EXPECT_NE(log.find("INFO: 4 rename(s) recorded"), std::string::npos)
      << log;
}
