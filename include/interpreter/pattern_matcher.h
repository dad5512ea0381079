#pragma once

#include <string>

// Case-pattern matching: exact text, `*`, `prefix*`, `*suffix` and `*infix*`. No other glob
// syntax is recognised; quote characters in the pattern are removed before matching.
class PatternMatcher {
   public:
    PatternMatcher() = default;
    ~PatternMatcher() = default;

    PatternMatcher(const PatternMatcher&) = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&) = default;
    PatternMatcher& operator=(PatternMatcher&&) = default;

    bool matches_pattern(const std::string& text, const std::string& pattern) const;

   private:
    bool matches_single_pattern(const std::string& text, const std::string& pattern) const;
};
