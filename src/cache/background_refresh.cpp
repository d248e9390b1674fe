#include "cache/background_refresh.hpp"
#include "daemon/process_runner.hpp"

#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

std::string BackgroundRefresh::self_path() {
    // Linux: /proc/self/exe is a symlink to the running binary
    std::error_code ec;
    fs::path self = fs::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return self.string();
}

bool BackgroundRefresh::spawn_model_refresh(const std::string& session_id,
                                            const std::string& transcript_path) {
    if (session_id.empty() || transcript_path.empty()) return false;

    std::string self = self_path();
    if (self.empty()) return false;

    try {
        return ProcessRunner::spawn_detached({
            self,
            "--internal-refresh-models",
            "--session-id", session_id,
            "--transcript-path", transcript_path,
        });
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> BackgroundRefresh::script_candidates(const std::string& self_dir) {
    std::vector<std::string> candidates;
    if (!self_dir.empty()) {
        candidates.push_back(self_dir + "/../bash/" + CUMULATIVE_SCRIPT);
        candidates.push_back(self_dir + "/" + CUMULATIVE_SCRIPT);
    }
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(std::string(home) + "/.claude/" + CUMULATIVE_SCRIPT);
    }
    return candidates;
}

std::string BackgroundRefresh::find_script(const std::vector<std::string>& candidates) {
    for (const auto& c : candidates) {
        std::error_code ec;
        fs::path abs = fs::absolute(c, ec);
        if (ec) continue;
        abs = abs.lexically_normal();
        if (!fs::is_regular_file(abs, ec)) continue;
        if (access(abs.c_str(), X_OK) != 0) continue;
        return abs.string();
    }
    return "";
}

bool BackgroundRefresh::spawn_cumulative_stats(const std::string& project_dir) {
    if (project_dir.empty()) return false;

    try {
        std::string self = self_path();
        std::string self_dir = self.empty() ? "" : fs::path(self).parent_path().string();

        std::string script = find_script(script_candidates(self_dir));
        if (script.empty()) return false;

        return ProcessRunner::spawn_detached({script, project_dir});
    } catch (const std::exception&) {
        return false;
    }
}
