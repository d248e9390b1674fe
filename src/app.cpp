#include "app.hpp"
#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/session.hpp"
#include "cache/usage_cache.hpp"
#include "cache/background_refresh.hpp"
#include "render/status_line.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

struct App::Impl {
    CliOptions options;
    Config config;
    bool background_enabled = true;

    explicit Impl(const CliOptions& opts) : options(opts) {}

    static std::string current_dir() {
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        return ec ? "" : cwd.string();
    }

    std::string render(const SessionSnapshot& session) {
        config.load(options.overrides);

        RenderContext ctx;
        ctx.cwd = current_dir();
        ctx.cache_dir = UsageCache::cache_dir();

        StatusLine line(config.data(), ctx);
        return line.render(session);
    }

    void fire_background(const SessionSnapshot& session) {
        if (!background_enabled) return;

        // Neither result matters to this render; the next one reads their output
        BackgroundRefresh::spawn_cumulative_stats(session.project_dir);
        if (!session.transcript_path.empty()) {
            BackgroundRefresh::spawn_model_refresh(
                UsageCache::session_id_from_transcript(session.transcript_path),
                session.transcript_path);
        }
    }
};

App::App(const CliOptions& options) : impl_(std::make_unique<Impl>(options)) {}

App::~App() = default;

void App::set_background_enabled(bool enabled) {
    impl_->background_enabled = enabled;
}

int App::run(std::istream& in, std::ostream& out) {
    SessionSnapshot session;
    std::string output;

    try {
        session = SessionSnapshot::parse(in);
        output = impl_->render(session);
    } catch (const std::exception&) {
        // Never break the host UI: fall back to an empty two-line render
        output = "\n\n";
    }

    out << output;
    out.flush();

    try {
        impl_->fire_background(session);
    } catch (const std::exception&) {
        // refresh simply does not happen this round
    }
    return 0;
}
