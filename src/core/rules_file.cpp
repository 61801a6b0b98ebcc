#include "rules_file.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

// Keeps rule order as written in the file.
using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

// ── JSON helpers ───────────────────────────────────────────────

/// Read an optional list of strings. Returns false if present with another shape.
static bool readStringList(const json& obj, const char* key, std::vector<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array()) {
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

static bool readBool(const json& obj, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_boolean()) {
        return false;
    }
    out = it->get<bool>();
    return true;
}

static bool readString(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static RuleEntry ruleEntryFromJson(const std::string& id, const json& j) {
    RuleEntry e;
    e.id = id;
    if (!j.is_object()) {
        e.malformed = "entry must be an object";
        return e;
    }

    auto fail = [&e](const char* field, const char* expected) {
        if (e.malformed.empty()) {
            e.malformed = std::string("field '") + field + "' must be " + expected;
        }
    };

    if (!readStringList(j, "domains", e.domains))         fail("domains", "a list of strings");
    if (!readStringList(j, "stripParams", e.strip_params)) fail("stripParams", "a list of strings");
    if (!readBool(j, "enabled", e.enabled))                fail("enabled", "a boolean");
    if (!readBool(j, "inheritGeneric", e.inherit_generic)) fail("inheritGeneric", "a boolean");
    if (!readBool(j, "stripFragment", e.strip_fragment))   fail("stripFragment", "a boolean");
    if (!readString(j, "transform", e.transform))          fail("transform", "a string");
    return e;
}

static json ruleEntryToJson(const RuleEntry& e) {
    json j{
        {"domains",        e.domains},
        {"stripParams",    e.strip_params},
        {"enabled",        e.enabled},
        {"inheritGeneric", e.inherit_generic},
        {"stripFragment",  e.strip_fragment}
    };
    if (!e.transform.empty()) {
        j["transform"] = e.transform;
    }
    return j;
}

// ── RulesFile implementation ───────────────────────────────────

RulesFileResult RulesFile::load(const std::string& path) {
    RulesFileResult result;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        result.status = RulesFileStatus::Missing;
        return result;
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        result.status = RulesFileStatus::Invalid;
        result.error = "cannot open " + path;
        return result;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return parse(ss.str());
}

RulesFileResult RulesFile::parse(const std::string& json_text) {
    RulesFileResult result;

    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (j.is_discarded()) {
        result.status = RulesFileStatus::Invalid;
        result.error = "not valid JSON";
        return result;
    }
    if (!j.is_object()) {
        result.status = RulesFileStatus::Invalid;
        result.error = "top level must be an object";
        return result;
    }

    result.status = RulesFileStatus::Loaded;

    if (!readStringList(j, "genericTrackingParams", result.config.generic_params)) {
        result.warnings.push_back("'genericTrackingParams' must be a list of strings; ignored");
    }

    auto rules = j.find("rules");
    if (rules == j.end() || rules->is_null()) {
        return result;
    }

    if (rules->is_object()) {
        for (auto it = rules->begin(); it != rules->end(); ++it) {
            result.config.rules.push_back(ruleEntryFromJson(it.key(), it.value()));
        }
    } else if (rules->is_array()) {
        size_t index = 0;
        for (const auto& item : *rules) {
            std::string id;
            if (item.is_object()) {
                auto id_it = item.find("id");
                if (id_it != item.end() && id_it->is_string()) {
                    id = id_it->get<std::string>();
                }
            }
            RuleEntry e = ruleEntryFromJson(id, item);
            if (id.empty()) {
                // Keep it so the build step reports it; give it a readable name.
                e.id = "rules[" + std::to_string(index) + "]";
                if (e.malformed.empty()) e.malformed = "entry has no string 'id'";
            }
            result.config.rules.push_back(std::move(e));
            ++index;
        }
    } else {
        result.warnings.push_back("'rules' must be an object or an array; ignored");
    }
    return result;
}

bool RulesFile::save(const std::string& path, const RuleConfig& config) {
    try {
        json rules = json::object();
        for (const auto& e : config.rules) {
            rules[e.id] = ruleEntryToJson(e);
        }
        json root{
            {"genericTrackingParams", config.generic_params},
            {"rules",                 rules}
        };

        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream ofs(path);
        if (!ofs.is_open()) {
            return false;
        }
        ofs << root.dump(4);
        return ofs.good();
    } catch (const std::exception&) {
        return false;
    }
}

std::shared_ptr<const RuleSet> loadRuleSet(const std::string& path, BuildReport* report) {
    Logger& log = Logger::instance();
    RuleConfig user;

    if (!path.empty()) {
        RulesFileResult file = RulesFile::load(path);
        switch (file.status) {
            case RulesFileStatus::Missing:
                log.info("No rules file at " + path + "; using built-in rules");
                break;
            case RulesFileStatus::Invalid:
                log.error("Rules file " + path + " ignored (" + file.error + "); using built-in rules");
                break;
            case RulesFileStatus::Loaded:
                for (const auto& w : file.warnings) {
                    log.warn("Rules file " + path + ": " + w);
                }
                user = std::move(file.config);
                break;
        }
    }

    BuildReport local;
    BuildReport& r = report ? *report : local;
    auto rules = std::make_shared<const RuleSet>(RuleSet::build(RuleSet::defaultConfig(), user, &r));
    log.info("Loaded " + std::to_string(rules->rules().size()) + " domain rules (" +
             std::to_string(r.errors.size()) + " rejected)");
    return rules;
}
