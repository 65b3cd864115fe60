#pragma once
// JSON interchange for circuits and rename ledgers.
//
// Circuit:
//   {"name": "Foo", "top": "Foo", "modules": [
//     {"kind": "module", "name": "Foo",
//      "ports": [{"name": "clk", "dir": "input",
//                 "type": {"kind": "Clock"}}, ...],
//      "body": [{"op": "wire", "name": "w", "type": {...}}, ...]},
//     {"kind": "extmodule", "name": "Ext", "ports": [...], "defname": "x"}]}
// Statements are tagged by "op": wire, reg, node, inst, mem, connect,
// invalid, when, block. Expressions are objects holding exactly one of
// "ref", "field" (with "of"), "lit", "prim" or "mux".

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rnm/ast/decl.hpp"
#include "rnm/rename/ledger.hpp"

namespace rnm {
namespace vis {

nlohmann::json circuitToJson(const ast::Circuit& c);
// Throws ConfigError on malformed input.
ast::Circuit circuitFromJson(const nlohmann::json& j);

// [{"from": "~Foo|Bar", "to": ["~pfx_Foo|pfx_Bar"]}, ...]
nlohmann::json ledgerToJson(const RenameLedger& ledger);
// Throws ConfigError on malformed input.
RenameLedger ledgerFromJson(const nlohmann::json& j);

inline nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("Cannot open file for reading: " + path);
    nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("Invalid JSON in file: " + path);
    return j;
}

inline void writeJsonFile(const std::string& path, const nlohmann::json& j) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << j.dump(2) << std::endl;
}

} // namespace vis
} // namespace rnm
