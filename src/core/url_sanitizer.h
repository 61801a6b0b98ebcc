#pragma once
#include <cstddef>
#include <string>

#include "rule_set.h"

/// Why a clipboard value was passed through untouched.
enum class SkipReason {
    None,               // sanitized (possibly with nothing to strip)
    Empty,
    TooLong,
    NotUrl,
    UnsupportedScheme,
    NoDomain,           // host is an IP literal
    MalformedEncoding,
};

/// Outcome of sanitizing one clipboard value.
struct SanitizationResult {
    std::string original;
    std::string cleaned;
    bool changed = false;
    std::string rule_id;    // rule whose strip list was applied; empty when skipped
    SkipReason skip = SkipReason::None;
};

/// Values longer than this are passed through without parsing.
constexpr size_t kMaxSanitizeLength = 8192;

/// Strip tracking data from `text` if it is a single http(s) URL.
/// Never throws on input content; anything that is not a well-formed URL,
/// or whose query is not safely decodable, comes back unchanged.
/// sanitize(sanitize(t).cleaned).cleaned == sanitize(t).cleaned for any t.
SanitizationResult sanitize(const std::string& text, const RuleSet& rules);

const char* skipReasonName(SkipReason reason);
