#include "render/status_line.hpp"
#include "render/ansi.hpp"
#include "render/line_composer.hpp"
#include "core/format.hpp"

#include <cmath>

using namespace ansi;

StatusLine::StatusLine(const AppConfig& config, const RenderContext& context)
    : config_(config), context_(context) {}

// ════════════════════════════════════════════════════════════════
// Line 1
// ════════════════════════════════════════════════════════════════

std::string StatusLine::model_name(const std::string& display_name) {
    static const std::string prefix = "Claude ";
    if (display_name.compare(0, prefix.size(), prefix) == 0) {
        return display_name.substr(prefix.size());
    }
    return display_name;
}

std::string StatusLine::model_mix(const ModelStats& stats) {
    long long max_out = stats.max_out();
    if (max_out <= 0) return "";

    auto glyph = [&](long long out, const char* clr) {
        std::string bar = Format::bar_char(out, max_out);
        if (bar.empty()) return std::string(DIM) + "·";
        return std::string(clr) + bar;
    };

    return glyph(stats.opus_out, MAGENTA) +
           glyph(stats.sonnet_out, CYAN) +
           glyph(stats.haiku_out, GREEN) + RST;
}

std::string StatusLine::model_section(const SessionSnapshot& session,
                                      const std::optional<ModelStats>& stats) const {
    std::string mix;
    if (config_.show_model_bars && stats) {
        mix = model_mix(*stats);
    }

    if (!config_.show_model) return mix;

    // Absent name shows "?"; a present but empty one hides the name
    std::string name = session.has_model_display_name ? model_name(session.model_display_name) : "?";
    if (name.empty()) return mix;

    std::string part = std::string(CYAN) + name + RST;
    if (!mix.empty()) part += " " + mix;
    return part;
}

std::string StatusLine::context_section(const SessionSnapshot& session) const {
    if (!config_.show_context) return "";

    int pct = Format::clamp_percent(session.used_percentage);
    const char* clr = GREEN;
    std::string warn;
    if (pct >= 90) {
        clr = RED;
        warn = " ⚠";
    } else if (pct >= 70) {
        clr = YELLOW;
        warn = " ⚠";
    }

    return std::string(clr) + Format::context_bar(pct) + " " + std::to_string(pct) + "%" + warn + RST;
}

std::string StatusLine::git_text(const GitSummary& summary) {
    std::string display = GitProbe::branch_display(summary);
    if (display.empty()) return "";

    std::string part = std::string(MAGENTA) + display + RST;
    if (summary.dirty) {
        part += std::string(" ") + YELLOW + "●" + RST;
    }
    std::string extra = GitProbe::extras(summary);
    if (!extra.empty()) {
        part += std::string(" ") + CYAN + extra + RST;
    }
    return part;
}

std::string StatusLine::git_section() const {
    if (!config_.show_git) return "";
    return git_text(GitProbe::probe(context_.cwd));
}

std::string StatusLine::diff_section(const SessionSnapshot& session) const {
    if (!config_.show_diff) return "";

    long long added = Format::clamp_count(session.total_lines_added);
    long long removed = Format::clamp_count(session.total_lines_removed);
    if (added <= 0 && removed <= 0) return "";

    return std::string(GREEN) + "+" + std::to_string(added) + RST + " " +
           RED + "-" + std::to_string(removed) + RST;
}

// ════════════════════════════════════════════════════════════════
// Line 2
// ════════════════════════════════════════════════════════════════

std::string StatusLine::tokens_section(const SessionSnapshot& session,
                                       const std::optional<ModelStats>& stats) const {
    if (!config_.show_tokens) return "";

    std::string parts;
    auto family = [&](const char* clr, const char* letter, long long in, long long out) {
        if (in <= 0 && out <= 0) return;
        if (!parts.empty()) parts += " ";
        parts += std::string(clr) + letter + RST + ":" + Format::count(in) + "/" + Format::count(out);
    };

    if (stats) {
        family(MAGENTA, "O", stats->opus_in, stats->opus_out);
        family(CYAN, "S", stats->sonnet_in, stats->sonnet_out);
        family(GREEN, "H", stats->haiku_in, stats->haiku_out);
    }
    if (!parts.empty()) return parts;

    return std::string(DIM) + "in:" + RST + Format::count(Format::clamp_count(session.total_input_tokens)) +
           " " + DIM + "out:" + RST + Format::count(Format::clamp_count(session.total_output_tokens));
}

long long StatusLine::tokens_per_second(double output_tokens, double api_ms) {
    long long out = Format::clamp_count(output_tokens);
    long long ms = Format::clamp_count(api_ms);
    if (out <= 0 || ms <= 0) return 0;
    // nearbyint honours the default round-half-even mode
    return Format::clamp_count(std::nearbyint(static_cast<double>(out) * 1000.0 / static_cast<double>(ms)));
}

std::string StatusLine::speed_section(const SessionSnapshot& session) const {
    if (!config_.show_speed) return "";
    if (session.total_api_duration_ms < 1 || session.total_output_tokens < 1) return "";

    long long speed = tokens_per_second(session.total_output_tokens, session.total_api_duration_ms);
    const char* clr = RED;
    if (speed > 30) {
        clr = GREEN;
    } else if (speed >= 15) {
        clr = YELLOW;
    }
    return std::string(clr) + std::to_string(speed) + " tok/s" + RST;
}

std::string StatusLine::cumulative_section(const std::string& glyph,
                                           const std::optional<CumulativeStats>& stats) const {
    if (!stats) return "";
    return glyph + " " + Format::cost(stats->d1) + "/" + Format::cost(stats->d7) + "/" + Format::cost(stats->d30);
}

// ════════════════════════════════════════════════════════════════
// Assembly
// ════════════════════════════════════════════════════════════════

std::string StatusLine::render(const SessionSnapshot& session) const {
    std::string session_id = UsageCache::session_id_from_transcript(session.transcript_path);

    std::optional<ModelStats> stats;
    if (!session_id.empty()) {
        stats = UsageCache::read_models(context_.cache_dir, session_id);
    }

    LineComposer line1;
    line1.add(model_section(session, stats))
         .add(context_section(session))
         .add(config_.show_cost ? Format::cost(session.total_cost_usd) : "")
         .add(config_.show_duration ? Format::duration(Format::clamp_count(session.total_duration_ms)) : "")
         .add(git_section())
         .add(diff_section(session));

    LineComposer line2;
    if (config_.line2) {
        line2.add(tokens_section(session, stats))
             .add(speed_section(session));

        if (config_.show_cumulative) {
            if (!session.project_dir.empty()) {
                line2.add(cumulative_section("⌂", UsageCache::read_cumulative(
                    UsageCache::project_cache_path(context_.cache_dir, session.project_dir))));
            }
            line2.add(cumulative_section("Σ", UsageCache::read_cumulative(
                UsageCache::global_cache_path(context_.cache_dir))));
        }
    }

    return LineComposer::finish(line1.str(), line2.str(), config_.no_color);
}
