#pragma once

#include <istream>
#include <string>

/// One render's worth of session telemetry, read from stdin.
/// Every field is optional; absent or mistyped values keep their defaults.
struct SessionSnapshot {
    std::string session_id;
    std::string cwd;
    std::string version;

    // model
    std::string model_id;
    std::string model_display_name;
    bool has_model_display_name = false;  // key present with a string value

    // cost
    double total_cost_usd = 0;
    double total_duration_ms = 0;
    double total_api_duration_ms = 0;
    double total_lines_added = 0;
    double total_lines_removed = 0;

    // context_window
    double used_percentage = 0;
    double context_window_size = 0;
    double total_input_tokens = 0;
    double total_output_tokens = 0;

    // workspace
    std::string project_dir;
    std::string current_dir;

    std::string transcript_path;

    /// Permissive parse: malformed JSON yields an empty snapshot, never throws
    static SessionSnapshot parse(const std::string& text);
    static SessionSnapshot parse(std::istream& in);
};
