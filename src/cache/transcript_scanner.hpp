#pragma once

#include <string>
#include <vector>

struct ModelUsage {
    std::string model;   // exact model id, e.g. "claude-opus-4-6"
    long long in = 0;    // input + cache read + cache creation
    long long out = 0;
};

class TranscriptScanner {
public:
    /// The transcript plus <dir>/<session_id>/subagents/*.jsonl
    static std::vector<std::string> files_for(const std::string& transcript_path,
                                              const std::string& session_id);

    /// Aggregate assistant usage counters per model id, ordered by id
    static std::vector<ModelUsage> scan(const std::vector<std::string>& files);

    /// Accumulate one JSONL line into usage; returns false if it was skipped
    static bool accumulate_line(const std::string& line, std::vector<ModelUsage>& usage);

    /// {"models":[{"model":..,"in":..,"out":..}, ...]}
    static std::string to_json(const std::vector<ModelUsage>& models);

    /// Rescan the session and atomically replace models-<session_id>.json
    static bool refresh(const std::string& session_id,
                        const std::string& transcript_path,
                        const std::string& cache_dir);
};
