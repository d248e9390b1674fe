#include "core/cli.hpp"
#include "cache/transcript_scanner.hpp"
#include "cache/usage_cache.hpp"

#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Parsing ─────────────────────────────────────────────────

/// "--name", "-name" -> "name"; anything else -> ""
static std::string flag_name(const std::string& arg) {
    if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) return arg.substr(2);
    if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') return arg.substr(1);
    return "";
}

CliOptions CLI::parse(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string name = flag_name(argv[i] ? argv[i] : "");
        if (name.empty()) continue;

        // --key=value
        std::string value;
        bool has_value = false;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }

        auto take_value = [&]() -> std::string {
            if (has_value) return value;
            if (i + 1 < argc && argv[i + 1]) return argv[++i];
            return "";
        };

        if (name == "help" || name == "h") {
            opts.help = true;
        } else if (name == "version" || name == "v") {
            opts.version = true;
        } else if (name == "no-color") {
            opts.overrides.no_color = true;
        } else if (name.compare(0, 3, "no-") == 0 && Config::is_valid_flag(name.substr(3))) {
            opts.overrides.disabled.insert(name.substr(3));
        } else if (name == "internal-refresh-models") {
            opts.refresh_models = true;
        } else if (name == "session-id") {
            opts.session_id = take_value();
        } else if (name == "transcript-path") {
            opts.transcript_path = take_value();
        }
        // unknown flags are ignored: a status line must always render
    }

    return opts;
}

// ── Dispatch ────────────────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    return run(parse(argc, argv));
}

int CLI::run(const CliOptions& options) {
    if (options.help) return cmd_help();
    if (options.version) return cmd_version();
    if (options.refresh_models) return cmd_refresh_models(options);
    return -1;  // render
}

// ── help ────────────────────────────────────────────────────

void CLI::print_help() {
    std::cerr <<
        "Usage: statusline [OPTIONS]\n"
        "Reads session JSON from stdin, writes a two-line status bar to stdout.\n"
        "\n"
        "Options:\n"
        "  --no-model       Hide model name\n"
        "  --no-model-bars  Hide model mix bars\n"
        "  --no-context     Hide context window bar\n"
        "  --no-cost        Hide session cost\n"
        "  --no-duration    Hide duration\n"
        "  --no-git         Hide git branch/status\n"
        "  --no-diff        Hide lines added/removed\n"
        "  --no-line2       Hide entire second line\n"
        "  --no-tokens      Hide token counts\n"
        "  --no-speed       Hide throughput (tok/s)\n"
        "  --no-cumulative  Hide cumulative costs\n"
        "  --no-color       Disable ANSI colors\n"
        "  --version        Show version\n"
        "  --help           Show this help\n"
        "\n"
        "Environment:\n"
        "  STATUSLINE_SHOW_<FEATURE>=false, STATUSLINE_LINE2=false  Disable a section\n"
        "  NO_COLOR, STATUSLINE_NO_COLOR                            Disable colors\n"
        "  XDG_CACHE_HOME                                           Relocate the usage cache\n"
        "\n"
        "Config precedence: CLI args > env vars > ~/.claude/statusline.env > defaults (all on)\n";
}

int CLI::cmd_help() {
    print_help();
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "statusline " << APP_VERSION << "\n";
    return 0;
}

// ── internal refresh ────────────────────────────────────────

int CLI::cmd_refresh_models(const CliOptions& options) {
    if (options.session_id.empty() || options.transcript_path.empty()) {
        std::cerr << "Warning: --internal-refresh-models needs --session-id and --transcript-path\n";
        return 1;
    }

    std::string dir = UsageCache::cache_dir();
    if (!TranscriptScanner::refresh(options.session_id, options.transcript_path, dir)) {
        std::cerr << "Warning: could not write model cache to " << dir << "\n";
        return 1;
    }
    return 0;
}
