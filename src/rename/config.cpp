#include "rnm/rename/config.hpp"
#include "rnm/rename/rules.hpp"

namespace rnm {

namespace {
struct RuleName {
    RuleKind mKind;
    const char* mName;
};
constexpr RuleName kRuleNames[] = {
  {RuleKind::VerilogKeywords, "verilog"}, {RuleKind::Keywords, "keywords"},
  {RuleKind::LowerCase, "lower"},         {RuleKind::UpperCase, "upper"},
  {RuleKind::Prefix, "prefix"},
};
} // namespace

const char* to_string(RuleKind k) {
    for (const auto& r : kRuleNames)
        if (r.mKind == k) return r.mName;
    return "?";
}

std::optional<RuleKind> parseRuleKind(std::string_view s) {
    for (const auto& r : kRuleNames)
        if (s == r.mName) return r.mKind;
    return std::nullopt;
}

RenameConfig parseRenameConfig(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("rename config must be an object");
    RenameConfig cfg;
    try {
        if (j.contains("rule")) {
            std::string name = j.at("rule").get<std::string>();
            auto kind = parseRuleKind(name);
            if (!kind) throw ConfigError("unknown rule '" + name + "'");
            cfg.mRule = *kind;
        }
        cfg.mPrefix = j.value("prefix", std::string());
        if (j.contains("keywords"))
            cfg.mKeywords = j.at("keywords").get<std::vector<std::string>>();
        if (j.contains("skips")) {
            for (const auto& s : j.at("skips"))
                cfg.mSkips.add(parseTarget(s.get<std::string>()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed rename config: ") + e.what());
    }
    return cfg;
}

nlohmann::json renameConfigToJson(const RenameConfig& cfg) {
    nlohmann::json j = {{"rule", to_string(cfg.mRule)}};
    if (cfg.mRule == RuleKind::Prefix) j["prefix"] = cfg.mPrefix;
    if (cfg.mRule == RuleKind::Keywords) j["keywords"] = cfg.mKeywords;
    nlohmann::json skips = nlohmann::json::array();
    for (const auto& t : cfg.mSkips.sorted())
        skips.push_back(t.toString());
    j["skips"] = skips;
    return j;
}

ManipulateRule makeRule(const RenameConfig& cfg) {
    switch (cfg.mRule) {
    case RuleKind::VerilogKeywords: return makeVerilogRenameRule();
    case RuleKind::Keywords:
        if (cfg.mKeywords.empty())
            throw ConfigError("rule 'keywords' needs a keyword list");
        return makeKeywordRule(
          Namespace::NameSet(cfg.mKeywords.begin(), cfg.mKeywords.end()));
    case RuleKind::LowerCase: return makeLowerCaseRule();
    case RuleKind::UpperCase: return makeUpperCaseRule();
    case RuleKind::Prefix:
        if (cfg.mPrefix.empty())
            throw ConfigError("rule 'prefix' needs a non-empty prefix");
        return makePrefixRule(cfg.mPrefix);
    }
    throw ConfigError("unknown rule");
}
} // namespace rnm
