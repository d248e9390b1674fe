#include <gtest/gtest.h>
#include "core/format.hpp"

// ── count ───────────────────────────────────────────────────

TEST(FormatCount, BandBoundaries) {
    EXPECT_EQ(Format::count(0), "0");
    EXPECT_EQ(Format::count(523), "523");
    EXPECT_EQ(Format::count(999), "999");
    EXPECT_EQ(Format::count(1000), "1.0k");
    EXPECT_EQ(Format::count(1234), "1.2k");
    EXPECT_EQ(Format::count(9999), "10.0k");
    EXPECT_EQ(Format::count(10000), "10k");
    EXPECT_EQ(Format::count(45231), "45k");
    EXPECT_EQ(Format::count(999999), "1000k");
    EXPECT_EQ(Format::count(1000000), "1.0M");
    EXPECT_EQ(Format::count(1234567), "1.2M");
}

TEST(FormatCount, SessionTotals) {
    EXPECT_EQ(Format::count(12000), "12k");
    EXPECT_EQ(Format::count(3000), "3.0k");
    EXPECT_EQ(Format::count(287500), "288k");
}

// ── cost ────────────────────────────────────────────────────

TEST(FormatCost, BandBoundaries) {
    EXPECT_EQ(Format::cost(0), "$0.00");
    EXPECT_EQ(Format::cost(0.99), "$0.99");
    EXPECT_EQ(Format::cost(1.0), "$1.0");
    EXPECT_EQ(Format::cost(9.99), "$10.0");
    EXPECT_EQ(Format::cost(10.0), "$10");
    EXPECT_EQ(Format::cost(99.99), "$100");
    EXPECT_EQ(Format::cost(100.0), "$100");
    EXPECT_EQ(Format::cost(999.99), "$1000");
    EXPECT_EQ(Format::cost(1000.0), "$1.0k");
}

TEST(FormatCost, TypicalValues) {
    EXPECT_EQ(Format::cost(0.12), "$0.12");
    EXPECT_EQ(Format::cost(2.5), "$2.5");
    EXPECT_EQ(Format::cost(8.42), "$8.4");
    EXPECT_EQ(Format::cost(14.2), "$14");
    EXPECT_EQ(Format::cost(374.0), "$374");
    EXPECT_EQ(Format::cost(1800.0), "$1.8k");
}

// ── duration ────────────────────────────────────────────────

TEST(FormatDuration, MinutesAndHours) {
    EXPECT_EQ(Format::duration(0), "0m");
    EXPECT_EQ(Format::duration(59999), "0m");
    EXPECT_EQ(Format::duration(125000), "2m");
    EXPECT_EQ(Format::duration(900000), "15m");
    EXPECT_EQ(Format::duration(3599999), "59m");
    EXPECT_EQ(Format::duration(3600000), "1h0m");
    EXPECT_EQ(Format::duration(5400000), "1h30m");
    EXPECT_EQ(Format::duration(14400000), "4h0m");
}

// ── shorten_branch ──────────────────────────────────────────

TEST(FormatBranch, KnownPrefixes) {
    EXPECT_EQ(Format::shorten_branch("feature/login"), "★login");
    EXPECT_EQ(Format::shorten_branch("feat/login"), "★login");
    EXPECT_EQ(Format::shorten_branch("fix/crash"), "✦crash");
    EXPECT_EQ(Format::shorten_branch("chore/deps"), "⚙deps");
    EXPECT_EQ(Format::shorten_branch("refactor/parser"), "↻parser");
    EXPECT_EQ(Format::shorten_branch("docs/readme"), "§readme");
}

TEST(FormatBranch, OnlyFirstPrefixReplaced) {
    EXPECT_EQ(Format::shorten_branch("fix/feature/x"), "✦feature/x");
    EXPECT_EQ(Format::shorten_branch("feature/fix/y"), "★fix/y");
}

TEST(FormatBranch, UnprefixedIsIdempotent) {
    for (const char* name : {"main", "develop", "release-1.2", "featureless", "fixes/x", ""}) {
        std::string once = Format::shorten_branch(name);
        EXPECT_EQ(once, name);
        EXPECT_EQ(Format::shorten_branch(once), once);
    }
}

// ── truncate ────────────────────────────────────────────────

TEST(FormatTruncate, ExactLengthUnchanged) {
    EXPECT_EQ(Format::truncate("hello", 5), "hello");
    EXPECT_EQ(Format::truncate("", 5), "");
}

TEST(FormatTruncate, LongerIsCutWithEllipsis) {
    EXPECT_EQ(Format::truncate("hello world", 5), "hell…");
    EXPECT_EQ(Format::utf8_length(Format::truncate("hello world", 5)), 5u);
}

TEST(FormatTruncate, CountsCodePointsNotBytes) {
    // 4 code points, 12 bytes
    std::string jp = "日本語名";
    EXPECT_EQ(Format::utf8_length(jp), 4u);
    EXPECT_EQ(Format::truncate(jp, 4), jp);
    EXPECT_EQ(Format::truncate(jp, 3), "日本…");

    std::string branch = "★a-very-long-feature-branch-name";
    std::string cut = Format::truncate(branch, 20);
    EXPECT_EQ(Format::utf8_length(cut), 20u);
    EXPECT_EQ(cut.substr(0, 3), "★");
}

TEST(FormatTruncate, NeverLongerThanMax) {
    std::string s = "abcdefghijklmnopqrstuvwxyz✦✦✦";
    for (size_t max = 1; max < 32; ++max) {
        EXPECT_LE(Format::utf8_length(Format::truncate(s, max)), max) << "max=" << max;
    }
}

// ── bars ────────────────────────────────────────────────────

TEST(FormatBar, NonPositiveIsEmpty) {
    EXPECT_EQ(Format::bar_char(0, 10), "");
    EXPECT_EQ(Format::bar_char(-3, 10), "");
    EXPECT_EQ(Format::bar_char(5, 0), "");
}

TEST(FormatBar, RoundsHalfUpAndClamps) {
    EXPECT_EQ(Format::bar_char(10, 10), "█");
    EXPECT_EQ(Format::bar_char(50, 10), "█");
    EXPECT_EQ(Format::bar_char(5, 10), "▄");
    EXPECT_EQ(Format::bar_char(1, 100), "▁");   // rounds to 0, clamped to 1
    EXPECT_EQ(Format::bar_char(3, 16), "▂");    // (24 + 8) / 16 = 2
    EXPECT_EQ(Format::bar_char(500, 1000), "▄");
}

TEST(FormatBar, ContextBarCells) {
    EXPECT_EQ(Format::context_bar(0), "░░░░░░░░░░");
    EXPECT_EQ(Format::context_bar(45), "▓▓▓▓░░░░░░");
    EXPECT_EQ(Format::context_bar(100), "▓▓▓▓▓▓▓▓▓▓");
    EXPECT_EQ(Format::context_bar(250), "▓▓▓▓▓▓▓▓▓▓");
    EXPECT_EQ(Format::context_bar(-5), "░░░░░░░░░░");
}

// ── Conversions ─────────────────────────────────────────────

TEST(FormatClamp, Counts) {
    EXPECT_EQ(Format::clamp_count(0), 0);
    EXPECT_EQ(Format::clamp_count(41000.9), 41000);
    EXPECT_EQ(Format::clamp_count(-3), 0);
    EXPECT_EQ(Format::clamp_count(1e20), 9223372036854775807LL);
    EXPECT_EQ(Format::clamp_count(9.2233720368547758e18), 9223372036854775807LL);
    EXPECT_EQ(Format::clamp_count(-1e300), 0);
}

TEST(FormatClamp, Percent) {
    EXPECT_EQ(Format::clamp_percent(45.7), 45);
    EXPECT_EQ(Format::clamp_percent(-1), 0);
    EXPECT_EQ(Format::clamp_percent(3e9), 2147483647);
}

TEST(FormatClamp, AddCountsSaturates) {
    EXPECT_EQ(Format::add_counts(2, 3), 5);
    EXPECT_EQ(Format::add_counts(9223372036854775807LL, 1), 9223372036854775807LL);
    EXPECT_EQ(Format::add_counts(-4, 3), 3);
}

TEST(FormatBar, HugeValuesDoNotOverflow) {
    EXPECT_EQ(Format::bar_char(9223372036854775807LL, 9223372036854775807LL), "█");
    EXPECT_EQ(Format::bar_char(1, 9223372036854775807LL), "▁");
    EXPECT_EQ(Format::bar_char(4611686018427387904LL, 9223372036854775807LL), "▄");
    EXPECT_EQ(Format::bar_char(9223372036854775807LL, 5), "█");
}
