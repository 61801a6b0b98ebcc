#include "url_sanitizer.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <vector>
#include <curl/curl.h>

namespace {

// ── libcurl URL handle ─────────────────────────────────────────

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

/// Fetch one part of a parsed URL; empty optional when the part is absent.
std::optional<std::string> urlPart(CURLU* handle, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string out(value);
    curl_free(value);
    return out;
}

// ── text helpers ───────────────────────────────────────────────

bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Form-style decoding ('+' is a space). Empty optional on a bad escape.
std::optional<std::string> percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= s.size()) {
                return std::nullopt;
            }
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

/// One '&'-separated segment of a query or fragment, kept verbatim.
struct Param {
    std::string raw;
    std::string name;   // decoded key
};

/// Split on '&', dropping empty segments. Empty optional when any segment
/// carries malformed percent-encoding.
std::optional<std::vector<Param>> parseParams(const std::string& s) {
    std::vector<Param> params;
    size_t start = 0;
    while (start <= s.size()) {
        size_t amp = s.find('&', start);
        size_t end = (amp == std::string::npos) ? s.size() : amp;
        std::string raw = s.substr(start, end - start);
        if (!raw.empty()) {
            size_t eq = raw.find('=');
            auto name = percentDecode(raw.substr(0, eq));
            if (!name) return std::nullopt;
            if (eq != std::string::npos && !percentDecode(raw.substr(eq + 1))) {
                return std::nullopt;
            }
            params.push_back(Param{raw, *name});
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::string joinParams(const std::vector<Param>& params) {
    std::string out;
    for (const auto& p : params) {
        if (!out.empty()) out.push_back('&');
        out += p.raw;
    }
    return out;
}

/// Remove every parameter the rule strips. Returns true if any was removed.
bool stripParams(std::vector<Param>& params, const Rule& rule) {
    auto before = params.size();
    params.erase(std::remove_if(params.begin(), params.end(),
                                [&](const Param& p) { return rule.strips(p.name); }),
                 params.end());
    return params.size() != before;
}

/// "/<11-char id>" on a short-link host, else empty.
std::string youtubeVideoId(const std::string& path) {
    constexpr size_t kIdLength = 11;
    if (path.size() != kIdLength + 1 || path[0] != '/') {
        return {};
    }
    for (size_t i = 1; i < path.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(path[i]);
        if (!std::isalnum(c) && c != '-' && c != '_') {
            return {};
        }
    }
    return path.substr(1);
}

/// Raw pieces of an absolute URL, sliced from the original text.
struct UrlSlices {
    std::string scheme;
    std::string authority;
    std::string path;
    bool has_query = false;
    std::string query;
    bool has_fragment = false;
    std::string fragment;
};

std::optional<UrlSlices> sliceUrl(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    UrlSlices s;
    s.scheme = url.substr(0, scheme_end);
    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) authority_end = url.size();
    s.authority = url.substr(authority_start, authority_end - authority_start);
    if (s.authority.empty()) {
        return std::nullopt;
    }

    size_t hash = url.find('#', authority_end);
    size_t path_query_end = (hash == std::string::npos) ? url.size() : hash;
    size_t qmark = url.find('?', authority_end);
    if (qmark != std::string::npos && qmark > path_query_end) qmark = std::string::npos;

    size_t path_end = (qmark == std::string::npos) ? path_query_end : qmark;
    s.path = url.substr(authority_end, path_end - authority_end);
    if (qmark != std::string::npos) {
        s.has_query = true;
        s.query = url.substr(qmark + 1, path_query_end - qmark - 1);
    }
    if (hash != std::string::npos) {
        s.has_fragment = true;
        s.fragment = url.substr(hash + 1);
    }
    return s;
}

/// False for IP literals: bracketed IPv6, or a last label that is all digits.
bool isDomainName(const std::string& host) {
    if (host.empty() || host[0] == '[') {
        return false;
    }
    std::string h = host;
    if (h.back() == '.') h.pop_back();
    size_t dot = h.rfind('.');
    std::string last = (dot == std::string::npos) ? h : h.substr(dot + 1);
    return last.empty() ||
           !std::all_of(last.begin(), last.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

const char* const kCanonicalYoutubeHost = "www.youtube.com";

/// The expanded watch URL must come back unchanged when sanitized again,
/// under whichever rule its canonical host matches.
bool expansionIsStable(const RuleSet& rules, bool has_fragment) {
    const Rule& canonical = rules.match(kCanonicalYoutubeHost);
    if (canonical.strips("v") || canonical.transform != RuleTransform::None) {
        return false;
    }
    return !(has_fragment && canonical.strip_fragment);
}

SanitizationResult passThrough(const std::string& text, SkipReason reason) {
    SanitizationResult r;
    r.original = text;
    r.cleaned = text;
    r.changed = false;
    r.skip = reason;
    return r;
}

}  // namespace

// ── sanitize ───────────────────────────────────────────────────

SanitizationResult sanitize(const std::string& text, const RuleSet& rules) {
    if (text.size() > kMaxSanitizeLength) {
        return passThrough(text, SkipReason::TooLong);
    }

    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isAsciiSpace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && isAsciiSpace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) {
        return passThrough(text, SkipReason::Empty);
    }

    const std::string body = text.substr(begin, end - begin);

    // A single URL only: no embedded whitespace or control bytes.
    for (unsigned char c : body) {
        if (c <= 0x20 || c == 0x7F) {
            return passThrough(text, SkipReason::NotUrl);
        }
    }

    CurlUrlPtr handle(curl_url());
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, body.c_str(), 0) != CURLUE_OK) {
        return passThrough(text, SkipReason::NotUrl);
    }

    auto scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    if (!scheme) {
        return passThrough(text, SkipReason::NotUrl);
    }
    std::string scheme_lower = toLower(*scheme);
    if (scheme_lower != "http" && scheme_lower != "https") {
        return passThrough(text, SkipReason::UnsupportedScheme);
    }

    auto host = urlPart(handle.get(), CURLUPART_HOST);
    auto slices = sliceUrl(body);
    if (!host || host->empty() || !slices || toLower(slices->scheme) != scheme_lower) {
        return passThrough(text, SkipReason::NotUrl);
    }

    auto params = parseParams(slices->query);
    if (!params) {
        return passThrough(text, SkipReason::MalformedEncoding);
    }

    if (!isDomainName(*host)) {
        return passThrough(text, SkipReason::NoDomain);
    }

    const Rule* rule = &rules.match(*host);
    bool expanded = false;
    bool rewritten = false;

    if (rule->transform == RuleTransform::YoutubeShortLink) {
        std::string video_id = youtubeVideoId(slices->path);
        if (!video_id.empty() &&
            expansionIsStable(rules, slices->has_fragment && !slices->fragment.empty())) {
            slices->authority = kCanonicalYoutubeHost;
            slices->path = "/watch";
            params->clear();
            params->push_back(Param{"v=" + video_id, "v"});
            expanded = true;
            rewritten = true;
        }
    }

    if (!expanded && stripParams(*params, *rule)) {
        rewritten = true;
    }

    if (rule->strip_fragment && slices->has_fragment &&
        slices->fragment.find('=') != std::string::npos) {
        auto frag_params = parseParams(slices->fragment);
        if (!frag_params) {
            return passThrough(text, SkipReason::MalformedEncoding);
        }
        if (stripParams(*frag_params, *rule)) {
            slices->fragment = joinParams(*frag_params);
            slices->has_fragment = !slices->fragment.empty();
            rewritten = true;
        }
    }

    SanitizationResult result;
    result.original = text;
    result.rule_id = rule->id;

    if (!rewritten) {
        result.cleaned = text;
        result.changed = false;
        return result;
    }

    std::string url = slices->scheme + "://" + slices->authority + slices->path;
    std::string query = joinParams(*params);
    if (!query.empty()) {
        url += "?" + query;
    }
    if (slices->has_fragment) {
        url += "#" + slices->fragment;
    }

    result.cleaned = text.substr(0, begin) + url + text.substr(end);
    result.changed = result.cleaned != text;
    if (result.changed) {
        Logger::instance().debug("Rule '" + rule->id + "' rewrote " + body + " -> " + url);
    }
    return result;
}

const char* skipReasonName(SkipReason reason) {
    switch (reason) {
        case SkipReason::None:              return "none";
        case SkipReason::Empty:             return "empty";
        case SkipReason::TooLong:           return "too-long";
        case SkipReason::NotUrl:            return "not-a-url";
        case SkipReason::UnsupportedScheme: return "unsupported-scheme";
        case SkipReason::NoDomain:          return "no-domain";
        case SkipReason::MalformedEncoding: return "malformed-encoding";
    }
    return "unknown";
}
