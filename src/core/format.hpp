#pragma once

#include <string>

class Format {
public:
    /// Token counts: 1234567->"1.2M", 45231->"45k", 1234->"1.2k", 523->"523"
    static std::string count(long long n);

    /// Currency: >=1000->"$1.8k", >=100->"$374", >=10->"$14", >=1->"$8.4", <1->"$0.12"
    static std::string cost(double c);

    /// Milliseconds to "4h0m" (>= 60 min) or "15m"
    static std::string duration(long long ms);

    /// Replace a conventional branch prefix (feature/, fix/, ...) with a glyph
    static std::string shorten_branch(const std::string& name);

    /// Truncate to max_len code points, ending in an ellipsis when cut
    static std::string truncate(const std::string& name, size_t max_len = 20);

    /// Number of UTF-8 code points in s
    static size_t utf8_length(const std::string& s);

    /// One of eight block glyphs proportional to value/max, "" when either is <= 0
    static std::string bar_char(long long value, long long max);

    /// Ten-cell context usage bar, one filled cell per 10%
    static std::string context_bar(int percent);

    /// Saturating double -> integer conversions; negatives become 0
    static long long clamp_count(double value);
    static int clamp_percent(double value);

    /// Sum of two non-negative counts, saturating at LLONG_MAX
    static long long add_counts(long long a, long long b);
};
