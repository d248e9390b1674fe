#pragma once

#include "core/config.hpp"

#include <string>

struct CliOptions {
    ConfigOverrides overrides;   // --no-<feature>, --no-color
    bool help = false;
    bool version = false;

    // Internal mode used by the detached model-cache refresh
    bool refresh_models = false;
    std::string session_id;
    std::string transcript_path;
};

class CLI {
public:
    /// Parse argv. Unknown arguments are ignored; this never fails.
    static CliOptions parse(int argc, char* argv[]);

    /// Handle terminal actions (help, version, internal refresh).
    /// Returns exit code, or -1 if the caller should render the status line.
    static int run(const CliOptions& options);
    static int run(int argc, char* argv[]);

    static void print_help();

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_refresh_models(const CliOptions& options);
};
