#pragma once

#include "cache/usage_cache.hpp"
#include "core/config.hpp"
#include "core/session.hpp"
#include "git/git_probe.hpp"

#include <optional>
#include <string>

struct RenderContext {
    std::string cwd;        // where git is queried
    std::string cache_dir;  // usage cache root
};

class StatusLine {
public:
    StatusLine(const AppConfig& config, const RenderContext& context);

    /// Full two-line output, newline-terminated
    std::string render(const SessionSnapshot& session) const;

    // ── Sections (empty string = omitted) ──────────────────

    std::string model_section(const SessionSnapshot& session, const std::optional<ModelStats>& stats) const;
    std::string context_section(const SessionSnapshot& session) const;
    std::string git_section() const;
    std::string diff_section(const SessionSnapshot& session) const;
    std::string tokens_section(const SessionSnapshot& session, const std::optional<ModelStats>& stats) const;
    std::string speed_section(const SessionSnapshot& session) const;
    std::string cumulative_section(const std::string& glyph, const std::optional<CumulativeStats>& stats) const;

    static std::string model_name(const std::string& display_name);
    static std::string model_mix(const ModelStats& stats);
    static std::string git_text(const GitSummary& summary);

    /// round-half-even of output_tokens * 1000 / api_ms; 0 when either is non-positive
    static long long tokens_per_second(double output_tokens, double api_ms);

private:
    AppConfig config_;
    RenderContext context_;
};
