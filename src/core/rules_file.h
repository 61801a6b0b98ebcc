#pragma once
#include <memory>
#include <string>
#include <vector>

#include "rule_set.h"

enum class RulesFileStatus {
    Loaded,
    Missing,    // no file at the path: run on built-in rules
    Invalid,    // unreadable / not JSON / not an object: run on built-in rules
};

struct RulesFileResult {
    RulesFileStatus status = RulesFileStatus::Missing;
    RuleConfig config;
    std::string error;                  // set for Invalid
    std::vector<std::string> warnings;  // fields ignored while reading
};

/// JSON rule configuration:
///
///   {
///     "genericTrackingParams": ["utm_source", ...],
///     "rules": {
///       "<id>": { "domains": [...], "stripParams": [...], "enabled": true,
///                 "inheritGeneric": true, "stripFragment": false,
///                 "transform": "youtube-short-link" }
///     }
///   }
///
/// "rules" may also be an array of entry objects carrying an "id".
/// An entry with a field of the wrong type is still returned, flagged as
/// malformed, so RuleSet::build() reports and drops only that entry.
class RulesFile {
public:
    /// Read and parse the file at `path`.
    static RulesFileResult load(const std::string& path);

    /// Parse JSON text (status is Loaded or Invalid).
    static RulesFileResult parse(const std::string& json_text);

    /// Write `config` as JSON (4-space indent). Returns true on success.
    static bool save(const std::string& path, const RuleConfig& config);
};

/// Build the active rule set from the built-in table and the file at `path`
/// (empty path: built-ins only). Never fails: a missing or unreadable file
/// yields the built-in rules, a malformed entry is dropped on its own.
std::shared_ptr<const RuleSet> loadRuleSet(const std::string& path,
                                           BuildReport* report = nullptr);
