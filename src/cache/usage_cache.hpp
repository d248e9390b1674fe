#pragma once

#include <optional>
#include <string>

/// Token totals per model family, aggregated from models-<session>.json
struct ModelStats {
    long long opus_in = 0;
    long long opus_out = 0;
    long long sonnet_in = 0;
    long long sonnet_out = 0;
    long long haiku_in = 0;
    long long haiku_out = 0;

    long long max_out() const;
};

/// Rolling cost windows from proj-<hash>.json / all.json
struct CumulativeStats {
    double d1 = 0;
    double d7 = 0;
    double d30 = 0;
};

class UsageCache {
public:
    /// $XDG_CACHE_HOME/claude-code-statusline or ~/.cache/claude-code-statusline
    static std::string cache_dir();

    /// First 8 hex chars of md5("<dir without leading slash, '/' -> '-'>\n")
    static std::string project_hash(const std::string& project_dir);

    /// Transcript base name without its extension
    static std::string session_id_from_transcript(const std::string& transcript_path);

    static std::string global_cache_path(const std::string& dir);
    static std::string project_cache_path(const std::string& dir, const std::string& project_dir);
    static std::string models_cache_path(const std::string& dir, const std::string& session_id);

    /// nullopt when the file is missing or unparseable
    static std::optional<ModelStats> read_models(const std::string& dir, const std::string& session_id);
    static std::optional<ModelStats> parse_models(const std::string& text);

    /// nullopt when missing, unparseable, or all three windows are zero
    static std::optional<CumulativeStats> read_cumulative(const std::string& path);
    static std::optional<CumulativeStats> parse_cumulative(const std::string& text);

    /// Write to a temp file in the same directory, then rename over path
    static bool write_atomic(const std::string& path, const std::string& content);

    static std::string read_file(const std::string& path);
};
