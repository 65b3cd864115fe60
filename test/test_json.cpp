#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "rnm/rename/config.hpp"
#include "rnm/rename/engine.hpp"
#include "rnm/vis/json.hpp"
#include "test_util.hpp"

using namespace rnm;
using namespace rnm::test;
using nlohmann::json;

static const char* kCircuitJson = R"({
  "name": "Foo",
  "modules": [
    {"kind": "extmodule", "name": "Ext", "defname": "ext_cell",
     "ports": [{"name": "q", "dir": "output",
                "type": {"kind": "UInt", "width": 4}}]},
    {"kind": "module", "name": "Foo",
     "ports": [{"name": "clk", "dir": "input", "type": {"kind": "Clock"}},
               {"name": "rst", "dir": "input", "type": {"kind": "Reset"}},
               {"name": "a", "dir": "input",
                "type": {"kind": "SInt", "width": 8}}],
     "body": [
       {"op": "inst", "name": "e", "module": "Ext"},
       {"op": "reg", "name": "r", "type": {"kind": "UInt", "width": 4},
        "clock": {"ref": "clk"}, "reset": {"ref": "rst"},
        "init": {"lit": 0, "width": 4}},
       {"op": "mem", "name": "m", "type": {"kind": "UInt", "width": 8},
        "depth": 16, "read-latency": 1, "write-latency": 1,
        "readers": ["rd"], "writers": ["wr"], "readwriters": []},
       {"op": "when", "cond": {"prim": "eq", "args": [{"ref": "r"},
                                                     {"lit": 3}]},
        "then": [{"op": "connect", "loc": {"ref": "r"},
                  "expr": {"field": "q", "of": {"ref": "e"}}}],
        "else": [{"op": "invalid",
                  "expr": {"field": "addr",
                           "of": {"field": "rd", "of": {"ref": "m"}}}}]},
       {"op": "block", "stmts": [
         {"op": "node", "name": "n",
          "value": {"mux": [{"ref": "r"},
                            {"prim": "bits", "args": [{"ref": "a"}],
                             "consts": [3, 0]},
                            {"lit": 1, "signed": true}]}}]},
       {"op": "wire", "name": "w", "type": {"kind": "UInt", "width": 1}}
     ]}
  ]
})";

TEST(CircuitJson, ReadsEveryConstruct) {
    Circuit c = vis::circuitFromJson(json::parse(kCircuitJson));
    EXPECT_EQ(c.mName, IdString("Foo"));
    EXPECT_EQ(c.mTop, IdString("Foo"));
    ASSERT_EQ(c.mModules.size(), 2u);

    const auto& ext = moduleNamed(c, "Ext");
    ASSERT_TRUE(ext.isExternal());
    EXPECT_EQ(ext.as<ExtModule>().mDefName, "ext_cell");
    EXPECT_EQ(ext.ports().front().mType, Type::uintOf(4));

    const auto& foo = moduleNamed(c, "Foo");
    EXPECT_EQ(foo.ports()[1].mType, Type::reset());
    EXPECT_EQ(foo.ports()[2].mType, Type::sintOf(8));

    const auto& m = declNamed(foo, "m").as<MemDecl>();
    EXPECT_EQ(m.mDepth, 16u);
    EXPECT_EQ(m.mReadLatency, 1);
    EXPECT_EQ(m.mReaders, ids({"rd"}));

    const auto& r = declNamed(foo, "r").as<RegDecl>();
    ASSERT_TRUE(r.mInit.has_value());
    EXPECT_EQ(exprToString(*r.mInit), "UInt<4>(0)");

    const auto& n = declNamed(foo, "n").as<NodeDecl>();
    EXPECT_EQ(exprToString(n.mValue), "mux(r, bits(a, 3, 0), SInt(1))");

    std::string text = circuitToString(c);
    EXPECT_NE(text.find("when eq(r, UInt(3)) :"), std::string::npos) << text;
    EXPECT_NE(text.find("r <= e.q"), std::string::npos) << text;
    EXPECT_NE(text.find("m.rd.addr is invalid"), std::string::npos) << text;
}

TEST(CircuitJson, WriteThenReadKeepsTheCircuit) {
    Circuit c = vis::circuitFromJson(json::parse(kCircuitJson));
    json j = vis::circuitToJson(c);
    EXPECT_EQ(j.at("top"), "Foo");
    EXPECT_EQ(j.at("modules").at(0).at("kind"), "extmodule");
    Circuit back = vis::circuitFromJson(j);
    EXPECT_EQ(circuitToString(back), circuitToString(c));
}

TEST(CircuitJson, RejectsMalformedInput) {
    auto bad = [](const char* text) {
        return [text] { vis::circuitFromJson(json::parse(text)); };
    };
    EXPECT_THROW(bad(R"({"modules": []})")(), ConfigError);
    EXPECT_THROW(bad(R"({"name": "A"})")(), ConfigError);
    EXPECT_THROW(bad(R"({"name": "A", "modules": [{"kind": "blob",
                        "name": "A"}]})")(),
                 ConfigError);
    EXPECT_THROW(bad(R"({"name": "A", "modules": [{"name": "A",
                        "body": [{"op": "frob"}]}]})")(),
                 ConfigError);
    EXPECT_THROW(bad(R"({"name": "A", "modules": [{"name": "A",
                        "ports": [{"name": "p", "dir": "inout",
                                   "type": {"kind": "UInt"}}]}]})")(),
                 ConfigError);
    EXPECT_THROW(bad(R"({"name": "A", "modules": [{"name": "A",
                        "body": [{"op": "node", "name": "n",
                                  "value": {"mux": [{"ref": "x"}]}}]}]})")(),
                 ConfigError);
    // Wrong JSON types are reported the same way
    EXPECT_THROW(bad(R"({"name": "A", "modules": [{"name": "A",
                        "body": [{"op": "node", "name": "n",
                                  "value": {"lit": "one"}}]}]})")(),
                 ConfigError);
}

TEST(LedgerJson, WriteThenRead) {
    RenameLedger ledger;
    ledger.record(parseTarget("~Foo|Bar"), parseTarget("~pfx_Foo|pfx_Bar"));
    ledger.record(parseTarget("~Foo"), parseTarget("~pfx_Foo"));
    json j = vis::ledgerToJson(ledger);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j.at(0).at("from"), "~Foo");
    EXPECT_EQ(j.at(0).at("to").at(0), "~pfx_Foo");

    RenameLedger back = vis::ledgerFromJson(j);
    EXPECT_EQ(back.resolve(parseTarget("~Foo|Bar")),
              parseTarget("~pfx_Foo|pfx_Bar"));

    EXPECT_THROW(vis::ledgerFromJson(json::parse(R"({"from": "~A"})")),
                 ConfigError);
    EXPECT_THROW(
      vis::ledgerFromJson(json::parse(R"([{"from": "A", "to": ["~B"]}])")),
      ConfigError);
}

TEST(JsonFile, MissingFileThrows) {
    EXPECT_THROW(vis::readJsonFile("/nonexistent/dir/circuit.json"),
                 std::runtime_error);
}

TEST(JsonFile, WriteThenRead) {
    std::string path = ::testing::TempDir() + "rnm_json_file_test.json";
    vis::writeJsonFile(path, json{{"rule", "upper"}});
    EXPECT_EQ(vis::readJsonFile(path).at("rule"), "upper");

    std::ofstream(path) << "{ not json";
    EXPECT_THROW(vis::readJsonFile(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(RenameConfig, Parse) {
    RenameConfig cfg = parseRenameConfig(json::parse(R"({
        "rule": "prefix", "prefix": "pfx_",
        "skips": ["~Foo|Foo", "~Foo|Foo/bar:Bar"]})"));
    EXPECT_EQ(cfg.mRule, RuleKind::Prefix);
    EXPECT_EQ(cfg.mPrefix, "pfx_");
    EXPECT_EQ(cfg.mSkips.size(), 2u);
    EXPECT_TRUE(cfg.mSkips.contains(parseTarget("~Foo|Foo/bar:Bar")));

    // Defaults
    RenameConfig dflt = parseRenameConfig(json::object());
    EXPECT_EQ(dflt.mRule, RuleKind::VerilogKeywords);
    EXPECT_TRUE(dflt.mSkips.empty());

    json j = renameConfigToJson(cfg);
    EXPECT_EQ(j.at("rule"), "prefix");
    EXPECT_EQ(j.at("skips").at(0), "~Foo|Foo");
    RenameConfig back = parseRenameConfig(j);
    EXPECT_EQ(back.mPrefix, "pfx_");
    EXPECT_EQ(back.mSkips.size(), 2u);
}

TEST(RenameConfig, RejectsBadInput) {
    EXPECT_THROW(parseRenameConfig(json::parse(R"({"rule": "title"})")),
                 ConfigError);
    EXPECT_THROW(parseRenameConfig(json::parse(R"({"rule": 3})")),
                 ConfigError);
    EXPECT_THROW(parseRenameConfig(json::parse("[]")), ConfigError);
    EXPECT_THROW(parseRenameConfig(json::parse(R"({"skips": ["Foo"]})")),
                 ConfigError);
    EXPECT_THROW(
      parseRenameConfig(json::parse(R"({"skips": ["~Foo|Foo/a:A>x"]})")),
      InvalidAddressError);
}

TEST(RenameConfig, MakeRule) {
    RenameConfig cfg;
    cfg.mRule = RuleKind::Prefix;
    EXPECT_THROW(makeRule(cfg), ConfigError);
    cfg.mPrefix = "p_";
    Namespace ns;
    EXPECT_EQ(makeRule(cfg)("a", ns), std::optional<std::string>("p_a"));

    cfg.mRule = RuleKind::Keywords;
    EXPECT_THROW(makeRule(cfg), ConfigError);
    cfg.mKeywords = {"a"};
    EXPECT_EQ(makeRule(cfg)("a", ns), std::optional<std::string>("a_"));

    for (const char* name : {"verilog", "keywords", "lower", "upper", "prefix"}) {
        auto kind = parseRuleKind(name);
        ASSERT_TRUE(kind.has_value()) << name;
        EXPECT_STREQ(to_string(*kind), name);
    }
    EXPECT_FALSE(parseRuleKind("Lower").has_value());
}
