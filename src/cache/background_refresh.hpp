#pragma once

#include <string>
#include <vector>

class BackgroundRefresh {
public:
    static constexpr const char* CUMULATIVE_SCRIPT = "cumulative-stats.sh";

    /// Re-run this binary detached in --internal-refresh-models mode.
    /// No-op when either argument is empty.
    static bool spawn_model_refresh(const std::string& session_id, const std::string& transcript_path);

    /// Launch the external cumulative-stats script for project_dir, if one is installed
    static bool spawn_cumulative_stats(const std::string& project_dir);

    /// Search order for the cumulative-stats script
    static std::vector<std::string> script_candidates(const std::string& self_dir);

    /// First candidate that is a regular, executable file; "" if none
    static std::string find_script(const std::vector<std::string>& candidates);

    /// Absolute path of the running binary ("" if unknown)
    static std::string self_path();
};
