#include "core/format.hpp"

#include <climits>
#include <cstdio>
#include <utility>

// ── Glyph tables ────────────────────────────────────────────

static const char* const BARS[8] = {
    "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█",
};

static const std::pair<const char*, const char*> BRANCH_PREFIXES[] = {
    {"feature/", "★"},
    {"feat/", "★"},
    {"fix/", "✦"},
    {"chore/", "⚙"},
    {"refactor/", "↻"},
    {"docs/", "§"},
};

static const char* const ELLIPSIS = "…";

static std::string printf_string(const char* fmt, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, v);
    return buf;
}

// ── Numbers ─────────────────────────────────────────────────

std::string Format::count(long long n) {
    if (n >= 1000000) {
        return printf_string("%.1fM", static_cast<double>(n) / 1000000.0);
    }
    if (n >= 10000) {
        return printf_string("%.0fk", static_cast<double>(n) / 1000.0);
    }
    if (n >= 1000) {
        return printf_string("%.1fk", static_cast<double>(n) / 1000.0);
    }
    return std::to_string(n);
}

std::string Format::cost(double c) {
    if (c >= 1000) {
        return printf_string("$%.1fk", c / 1000.0);
    }
    // >=100 and >=10 both render whole dollars
    if (c >= 100) {
        return printf_string("$%.0f", c);
    }
    if (c >= 10) {
        return printf_string("$%.0f", c);
    }
    if (c >= 1) {
        return printf_string("$%.1f", c);
    }
    return printf_string("$%.2f", c);
}

std::string Format::duration(long long ms) {
    long long minutes = ms / 60000;
    if (minutes >= 60) {
        return std::to_string(minutes / 60) + "h" + std::to_string(minutes % 60) + "m";
    }
    return std::to_string(minutes) + "m";
}

// ── Names ───────────────────────────────────────────────────

std::string Format::shorten_branch(const std::string& name) {
    for (const auto& [prefix, icon] : BRANCH_PREFIXES) {
        std::string p(prefix);
        if (name.compare(0, p.size(), p) == 0) {
            return std::string(icon) + name.substr(p.size());
        }
    }
    return name;
}

size_t Format::utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string Format::truncate(const std::string& name, size_t max_len) {
    if (max_len == 0) return "";
    if (utf8_length(name) <= max_len) return name;

    // Byte offset of the (max_len - 1)th code point
    size_t keep = max_len - 1;
    size_t seen = 0;
    size_t pos = 0;
    for (; pos < name.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(name[pos]);
        if ((c & 0xC0) != 0x80) {
            if (seen == keep) break;
            ++seen;
        }
    }
    return name.substr(0, pos) + ELLIPSIS;
}

// ── Bars ────────────────────────────────────────────────────

std::string Format::bar_char(long long value, long long max) {
    if (value <= 0 || max <= 0) return "";
    // Anything at or above max is the full block; shrink both so value * 8 cannot overflow
    if (value > max) value = max;
    while (max > LLONG_MAX / 16) {
        value /= 2;
        max /= 2;
    }
    long long level = (value * 8 + max / 2) / max;
    if (level < 1) level = 1;
    if (level > 8) level = 8;
    return BARS[level - 1];
}

std::string Format::context_bar(int percent) {
    int filled = percent / 10;
    if (filled < 0) filled = 0;
    if (filled > 10) filled = 10;

    std::string bar;
    for (int i = 0; i < filled; ++i) bar += "▓";
    for (int i = filled; i < 10; ++i) bar += "░";
    return bar;
}

// ── Conversions ─────────────────────────────────────────────

long long Format::clamp_count(double value) {
    if (!(value > 0)) return 0;
    // LLONG_MAX rounds up to 2^63 as a double
    if (value >= static_cast<double>(LLONG_MAX)) return LLONG_MAX;
    return static_cast<long long>(value);
}

int Format::clamp_percent(double value) {
    if (!(value > 0)) return 0;
    if (value >= static_cast<double>(INT_MAX)) return INT_MAX;
    return static_cast<int>(value);
}

long long Format::add_counts(long long a, long long b) {
    if (a < 0) a = 0;
    if (b < 0) b = 0;
    if (b > LLONG_MAX - a) return LLONG_MAX;
    return a + b;
}
