#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;       // -1 when the child did not exit normally
    bool timed_out = false;
    bool spawned = false;
    bool truncated = false;   // output exceeded MAX_OUTPUT and the rest was discarded
    std::string output;       // captured stdout

    bool ok() const { return spawned && !timed_out && exit_code == 0; }
};

class ProcessRunner {
public:
    static constexpr size_t MAX_OUTPUT = 1 << 20;

    /// Run argv[0] (PATH lookup) with stdin/stderr on /dev/null, capture stdout.
    /// The child is killed with SIGKILL once timeout_ms elapses.
    static CommandResult run(const std::vector<std::string>& argv, int timeout_ms);

    /// Launch argv detached from this process (own session, stdio on /dev/null).
    /// Returns once the launch has been handed off; never waits for the task.
    static bool spawn_detached(const std::vector<std::string>& argv);

    /// Trim trailing newlines / carriage returns
    static std::string chomp(std::string s);
};
