#include "token_filter.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <cstring>

const char* const kSpecialChars = "!@#$%^&*()_+-=[]{}|;:,.<>?/~`";

bool four_class_complexity(const std::string& token) {
    bool upper = false, lower = false, digit = false, special = false;
    for (unsigned char c : token) {
        if (c >= 'A' && c <= 'Z') upper = true;
        else if (c >= 'a' && c <= 'z') lower = true;
        else if (c >= '0' && c <= '9') digit = true;
        else if (c != 0 && std::strchr(kSpecialChars, c)) special = true;
    }
    return upper && lower && digit && special;
}

const char* skip_reason_name(SkipReason r) {
    switch (r) {
    case SkipReason::Empty:              return "empty";
    case SkipReason::TooLong:            return "too_long";
    case SkipReason::EmptyAfterCleaning: return "empty_after_cleaning";
    case SkipReason::LowComplexity:      return "low_complexity";
    }
    return "unknown";
}

static FilterResult skipped(SkipReason reason) {
    FilterResult r;
    r.reason = reason;
    return r;
}

FilterResult filter_token(const std::string& candidate, const FilterConfig& config) {
    const std::string trimmed = trim_text(candidate);
    if (trimmed.empty()) return skipped(SkipReason::Empty);

    if (utf8_length(trimmed) > config.max_length) return skipped(SkipReason::TooLong);

    std::string token = strip_invisible(trimmed);
    if (token.empty()) return skipped(SkipReason::EmptyAfterCleaning);

    if (config.require_complexity) {
        const ComplexityRule& rule = config.complexity ? config.complexity : four_class_complexity;
        if (!rule(token)) return skipped(SkipReason::LowComplexity);
    }

    FilterResult r;
    r.accepted = true;
    r.token = std::move(token);
    return r;
}
