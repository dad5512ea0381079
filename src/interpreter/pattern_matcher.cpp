#include "pattern_matcher.h"

#include <string>

namespace {

std::string strip_pattern_quotes(const std::string& raw_pattern) {
    std::string cleaned;
    cleaned.reserve(raw_pattern.size());

    for (size_t i = 0; i < raw_pattern.size(); ++i) {
        char ch = raw_pattern[i];

        if (ch == '\\' && i + 1 < raw_pattern.size()) {
            cleaned += raw_pattern[i + 1];
            ++i;
            continue;
        }

        if (ch == '\'' || ch == '"') {
            continue;
        }

        cleaned += ch;
    }

    return cleaned;
}

bool has_prefix(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool has_suffix(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool PatternMatcher::matches_pattern(const std::string& text, const std::string& pattern) const {
    bool quoted = pattern.find_first_of("'\"\\") != std::string::npos;
    std::string sanitized = strip_pattern_quotes(pattern);

    if (quoted) {
        // A quoted pattern is literal, stars included.
        return text == sanitized;
    }

    return matches_single_pattern(text, sanitized);
}

bool PatternMatcher::matches_single_pattern(const std::string& text,
                                            const std::string& pattern) const {
    if (pattern == "*") {
        return true;
    }

    bool leading = !pattern.empty() && pattern.front() == '*';
    bool trailing = pattern.size() > 1 && pattern.back() == '*';

    if (leading && trailing) {
        std::string middle = pattern.substr(1, pattern.size() - 2);
        return text.find(middle) != std::string::npos;
    }
    if (trailing) {
        return has_prefix(text, pattern.substr(0, pattern.size() - 1));
    }
    if (leading) {
        return has_suffix(text, pattern.substr(1));
    }
    return text == pattern;
}
