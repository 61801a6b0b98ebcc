#pragma once
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/// Structural rewrites a rule can apply before its strip list.
enum class RuleTransform {
    None,
    YoutubeShortLink,   // youtu.be/<id> -> www.youtube.com/watch?v=<id>
};

/// One sanitization policy. Immutable once owned by a RuleSet.
struct Rule {
    std::string id;
    std::vector<std::string> domains;     // lower-case suffixes, empty for the generic rule
    std::set<std::string> strip_params;   // effective list (generic names merged in when inherited)
    bool inherit_generic = true;
    bool strip_fragment = false;
    RuleTransform transform = RuleTransform::None;

    bool isGeneric() const { return domains.empty(); }
    bool strips(const std::string& param) const { return strip_params.count(param) != 0; }
};

/// A rule as supplied by configuration, before validation.
struct RuleEntry {
    std::string id;
    std::vector<std::string> domains;
    std::vector<std::string> strip_params;
    bool enabled = true;
    bool inherit_generic = true;
    bool strip_fragment = false;
    std::string transform;     // empty = none
    std::string malformed;     // set by the reader when a field had the wrong shape
};

/// Rule configuration: the built-in defaults and the user file share this shape.
struct RuleConfig {
    std::vector<std::string> generic_params;
    std::vector<RuleEntry> rules;
};

/// A rule definition that could not be accepted.
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& rule_id, const std::string& what)
        : std::runtime_error(what), rule_id_(rule_id) {}

    const std::string& ruleId() const noexcept { return rule_id_; }

private:
    std::string rule_id_;
};

/// Problems found while building a RuleSet. The set itself is always usable.
struct BuildReport {
    std::vector<ConfigError> errors;
};

class RuleSet {
public:
    static constexpr const char* kGenericRuleId = "generic";

    /// Built-in defaults only.
    RuleSet();

    /// Merge `user` over `defaults`. Each malformed user entry is excluded,
    /// logged as a ConfigError and appended to `report` when given; every
    /// other entry stays active.
    static RuleSet build(const RuleConfig& defaults,
                         const RuleConfig& user,
                         BuildReport* report = nullptr);

    /// The built-in rule table.
    static const RuleConfig& defaultConfig();

    /// Most specific rule for `host` (longest matching domain suffix), or the
    /// generic fallback. Case-insensitive, ignores a leading "www.".
    const Rule& match(const std::string& host) const;

    const Rule& genericRule() const { return generic_; }
    const std::vector<Rule>& rules() const { return rules_; }
    const Rule* findRule(const std::string& id) const;

    /// Lower-case, drop one trailing '.' and a leading "www.".
    static std::string normalizeHost(const std::string& host);

    /// Accepts plain domain names (optionally prefixed with "*." or "www.").
    static bool isValidDomainPattern(const std::string& pattern);

    static std::optional<RuleTransform> parseTransform(const std::string& name);

private:
    RuleSet(std::vector<Rule> rules, Rule generic);

    std::vector<Rule> rules_;
    Rule generic_;
};
