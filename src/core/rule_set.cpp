#include "rule_set.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

// ── helpers ────────────────────────────────────────────────────

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/// True when `host` equals `domain` or ends with "." + domain.
static bool domainMatches(const std::string& host, const std::string& domain) {
    if (host.size() == domain.size()) {
        return host == domain;
    }
    if (host.size() < domain.size() + 1) {
        return false;
    }
    size_t offset = host.size() - domain.size();
    return host[offset - 1] == '.' && host.compare(offset, domain.size(), domain) == 0;
}

/// Lower-case a validated pattern and drop the "*." / "www." prefixes.
static std::string canonicalPattern(const std::string& pattern) {
    std::string p = toLower(pattern);
    if (startsWith(p, "*.")) p = p.substr(2);
    if (!p.empty() && p.back() == '.') p.pop_back();
    if (startsWith(p, "www.") && p.size() > 4) p = p.substr(4);
    return p;
}

static RuleConfig makeDefaultConfig() {
    RuleConfig cfg;
    cfg.generic_params = {
        "utm_source", "utm_medium", "utm_campaign", "utm_term", "utm_content",
        "utm_id", "utm_name",
        "fbclid", "gclid", "dclid", "msclkid",
        "mc_cid", "mc_eid", "igshid", "_hsenc", "_hsmi",
    };

    auto entry = [](const char* id,
                    std::vector<std::string> domains,
                    std::vector<std::string> params,
                    const char* transform = "") {
        RuleEntry e;
        e.id = id;
        e.domains = std::move(domains);
        e.strip_params = std::move(params);
        e.transform = transform;
        return e;
    };

    cfg.rules = {
        entry("youtube",        {"youtube.com"},             {"si", "feature"}),
        entry("youtube-music",  {"music.youtube.com"},       {"si"}),
        entry("youtube-short",  {"youtu.be"},                {"si", "feature"}, "youtube-short-link"),
        entry("x",              {"x.com", "twitter.com"},    {"s", "t", "ref_src", "ref_url"}),
        entry("spotify",        {"open.spotify.com"},        {"si", "context"}),
        entry("instagram",      {"instagram.com"},           {"igsh", "img_index"}),
        entry("tiktok",         {"tiktok.com"},              {"_r", "_t", "is_from_webapp", "sender_device"}),
    };
    return cfg;
}

/// Validate one entry into a Rule. Throws ConfigError.
static Rule compileEntry(const RuleEntry& e) {
    if (e.id.empty()) {
        throw ConfigError(e.id, "rule without an id");
    }
    if (!e.malformed.empty()) {
        throw ConfigError(e.id, "rule '" + e.id + "': " + e.malformed);
    }
    if (e.domains.empty()) {
        throw ConfigError(e.id, "rule '" + e.id + "' has no domains");
    }

    Rule rule;
    rule.id = e.id;
    for (const auto& d : e.domains) {
        if (!RuleSet::isValidDomainPattern(d)) {
            throw ConfigError(e.id, "rule '" + e.id + "': invalid domain pattern '" + d + "'");
        }
        rule.domains.push_back(canonicalPattern(d));
    }
    for (const auto& p : e.strip_params) {
        if (p.empty()) {
            throw ConfigError(e.id, "rule '" + e.id + "': empty parameter name");
        }
        rule.strip_params.insert(p);
    }

    auto transform = RuleSet::parseTransform(e.transform);
    if (!transform) {
        throw ConfigError(e.id, "rule '" + e.id + "': unknown transform '" + e.transform + "'");
    }
    rule.transform = *transform;
    rule.inherit_generic = e.inherit_generic;
    rule.strip_fragment = e.strip_fragment;
    return rule;
}

static void reportError(BuildReport* report, const ConfigError& err) {
    Logger::instance().warn(std::string("Config error: ") + err.what());
    if (report) {
        report->errors.push_back(err);
    }
}

// ── RuleSet implementation ─────────────────────────────────────

RuleSet::RuleSet()
    : RuleSet(build(defaultConfig(), RuleConfig{})) {}

RuleSet::RuleSet(std::vector<Rule> rules, Rule generic)
    : rules_(std::move(rules)), generic_(std::move(generic)) {}

const RuleConfig& RuleSet::defaultConfig() {
    static const RuleConfig cfg = makeDefaultConfig();
    return cfg;
}

RuleSet RuleSet::build(const RuleConfig& defaults,
                       const RuleConfig& user,
                       BuildReport* report) {
    Rule generic;
    generic.id = kGenericRuleId;
    for (const auto& p : defaults.generic_params) {
        generic.strip_params.insert(p);
    }
    for (const auto& p : user.generic_params) {
        if (p.empty()) {
            reportError(report, ConfigError("genericTrackingParams",
                                            "genericTrackingParams: empty parameter name"));
            continue;
        }
        generic.strip_params.insert(p);
    }

    // Defaults first, in order; user entries override by id or append.
    std::vector<Rule> rules;
    for (const auto& e : defaults.rules) {
        if (!e.enabled) continue;
        try {
            rules.push_back(compileEntry(e));
        } catch (const ConfigError& err) {
            reportError(report, err);
        }
    }

    for (const auto& e : user.rules) {
        auto existing = std::find_if(rules.begin(), rules.end(),
                                     [&](const Rule& r) { return r.id == e.id; });
        if (!e.enabled) {
            if (existing != rules.end()) {
                Logger::instance().debug("Rule '" + e.id + "' disabled by configuration");
                rules.erase(existing);
            }
            continue;
        }
        try {
            Rule rule = compileEntry(e);
            if (existing != rules.end()) {
                *existing = std::move(rule);
            } else {
                rules.push_back(std::move(rule));
            }
        } catch (const ConfigError& err) {
            reportError(report, err);
        }
    }

    for (auto& rule : rules) {
        if (rule.inherit_generic) {
            rule.strip_params.insert(generic.strip_params.begin(), generic.strip_params.end());
        }
    }

    return RuleSet(std::move(rules), std::move(generic));
}

const Rule& RuleSet::match(const std::string& host) const {
    std::string h = normalizeHost(host);

    const Rule* best = nullptr;
    size_t best_len = 0;
    for (const auto& rule : rules_) {
        for (const auto& domain : rule.domains) {
            if (domain.size() > best_len && domainMatches(h, domain)) {
                best = &rule;
                best_len = domain.size();
            }
        }
    }
    return best ? *best : generic_;
}

const Rule* RuleSet::findRule(const std::string& id) const {
    if (id == generic_.id) {
        return &generic_;
    }
    for (const auto& rule : rules_) {
        if (rule.id == id) return &rule;
    }
    return nullptr;
}

std::string RuleSet::normalizeHost(const std::string& host) {
    std::string h = toLower(host);
    if (!h.empty() && h.back() == '.') h.pop_back();
    if (startsWith(h, "www.") && h.size() > 4) h = h.substr(4);
    return h;
}

bool RuleSet::isValidDomainPattern(const std::string& pattern) {
    std::string p = pattern;
    if (startsWith(p, "*.")) p = p.substr(2);
    if (!p.empty() && p.back() == '.') p.pop_back();
    if (p.empty() || p.size() > 253) {
        return false;
    }

    size_t start = 0;
    while (start <= p.size()) {
        size_t dot = p.find('.', start);
        size_t end = (dot == std::string::npos) ? p.size() : dot;
        size_t len = end - start;
        if (len == 0 || len > 63) {
            return false;
        }
        if (p[start] == '-' || p[end - 1] == '-') {
            return false;
        }
        for (size_t i = start; i < end; ++i) {
            unsigned char c = static_cast<unsigned char>(p[i]);
            if (!std::isalnum(c) && c != '-') {
                return false;
            }
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

std::optional<RuleTransform> RuleSet::parseTransform(const std::string& name) {
    static const std::map<std::string, RuleTransform> kTransforms = {
        {"",                   RuleTransform::None},
        {"none",               RuleTransform::None},
        {"youtube-short-link", RuleTransform::YoutubeShortLink},
    };
    auto it = kTransforms.find(toLower(name));
    if (it == kTransforms.end()) {
        return std::nullopt;
    }
    return it->second;
}
