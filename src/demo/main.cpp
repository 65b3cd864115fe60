#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "rnm/ast/decl.hpp"
#include "rnm/rename/config.hpp"
#include "rnm/rename/engine.hpp"
#include "rnm/vis/json.hpp"

using namespace rnm;

static cxxopts::Options makeOptions() {
    cxxopts::Options opts("rnm-rename",
                          "Rename the identifiers of a circuit with one rule");
    opts.positional_help("<circuit.json>");
    opts.parse_positional({"circuit"});
    opts.add_options()
      ("circuit", "Input circuit JSON", cxxopts::value<std::string>())
      ("c,config", "Rename config JSON (rule, prefix, keywords, skips)",
       cxxopts::value<std::string>())
      ("r,rule", "Rule: verilog, keywords, lower, upper, prefix",
       cxxopts::value<std::string>())
      ("p,prefix", "Prefix for the prefix rule", cxxopts::value<std::string>())
      ("k,keyword", "Keyword for the keywords rule (repeatable)",
       cxxopts::value<std::vector<std::string>>())
      ("s,skip", "Target to leave untouched (repeatable)",
       cxxopts::value<std::vector<std::string>>())
      ("o,out", "Output circuit JSON (- for stdout)",
       cxxopts::value<std::string>()->default_value("-"))
      ("l,ledger", "Write the rename ledger JSON here",
       cxxopts::value<std::string>())
      ("d,dump", "Print the renamed circuit as text")
      ("v,verbose", "Log every rename to stderr")
      ("h,help", "Print usage");
    return opts;
}

// Config file first; command-line options override or extend it.
static RenameConfig buildConfig(const cxxopts::ParseResult& res) {
    RenameConfig cfg;
    if (res.count("config"))
        cfg = parseRenameConfig(vis::readJsonFile(res["config"].as<std::string>()));
    if (res.count("rule")) {
        std::string name = res["rule"].as<std::string>();
        auto kind = parseRuleKind(name);
        if (!kind) throw ConfigError("unknown rule '" + name + "'");
        cfg.mRule = *kind;
    }
    if (res.count("prefix")) cfg.mPrefix = res["prefix"].as<std::string>();
    if (res.count("keyword")) {
        for (const auto& k : res["keyword"].as<std::vector<std::string>>())
            cfg.mKeywords.push_back(k);
    }
    if (res.count("skip")) {
        for (const auto& s : res["skip"].as<std::vector<std::string>>())
            cfg.mSkips.add(parseTarget(s));
    }
    return cfg;
}

int main(int argc, char** argv) {
    auto opts = makeOptions();
    cxxopts::ParseResult res;
    try {
        res = opts.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        error(&std::cerr, e.what());
        return 2;
    }
    if (res.count("help") || !res.count("circuit")) {
        std::cout << opts.help() << "\n";
        return res.count("help") ? 0 : 2;
    }
    std::ostream* diag = res.count("verbose") ? &std::cerr : nullptr;

    try {
        RenameConfig cfg = buildConfig(res);
        ast::Circuit in =
          vis::circuitFromJson(vis::readJsonFile(res["circuit"].as<std::string>()));
        info(diag, "rule " + std::string(to_string(cfg.mRule)) + ", " +
                     std::to_string(cfg.mSkips.size()) + " skip(s)");

        RenameLedger ledger;
        RenameEngine engine(makeRule(cfg), diag);
        ast::Circuit out = engine.run(in, ledger, cfg.mSkips);

        if (res.count("dump")) ast::dumpCircuit(out, std::cerr);
        std::string outPath = res["out"].as<std::string>();
        if (outPath == "-") {
            std::cout << vis::circuitToJson(out).dump(2) << std::endl;
        } else {
            vis::writeJsonFile(outPath, vis::circuitToJson(out));
        }
        if (res.count("ledger"))
            vis::writeJsonFile(res["ledger"].as<std::string>(),
                               vis::ledgerToJson(ledger));
    } catch (const ConfigError& e) {
        error(&std::cerr, e.what());
        return 2;
    } catch (const std::exception& e) {
        error(&std::cerr, e.what());
        return 1;
    }
    return 0;
}
