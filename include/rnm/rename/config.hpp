#pragma once
// Rule selection and skip targets, loaded from JSON:
//   {"rule": "verilog", "prefix": "pfx_", "keywords": [...],
//    "skips": ["~Foo|Foo", ...]}

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "rnm/rename/engine.hpp"
#include "rnm/target/skip_set.hpp"

namespace rnm {

enum class RuleKind { VerilogKeywords, Keywords, LowerCase, UpperCase, Prefix };

const char* to_string(RuleKind k);
std::optional<RuleKind> parseRuleKind(std::string_view s);

struct RenameConfig {
    RuleKind mRule = RuleKind::VerilogKeywords;
    std::string mPrefix;                 // Prefix
    std::vector<std::string> mKeywords;  // Keywords
    SkipSet mSkips;
};

// Throws ConfigError; a non-local skip throws InvalidAddressError.
RenameConfig parseRenameConfig(const nlohmann::json& j);
nlohmann::json renameConfigToJson(const RenameConfig& cfg);

// Throws ConfigError when the rule lacks its parameters (an empty prefix,
// an empty keyword list).
ManipulateRule makeRule(const RenameConfig& cfg);

} // namespace rnm
