#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

struct AppConfig {
    // Line 1
    bool show_model = true;
    bool show_model_bars = true;
    bool show_context = true;
    bool show_cost = true;
    bool show_duration = true;
    bool show_git = true;
    bool show_diff = true;

    // Line 2
    bool line2 = true;
    bool show_tokens = true;
    bool show_speed = true;
    bool show_cumulative = true;

    // Output
    bool no_color = false;
};

/// Highest-precedence layer, filled from command-line flags
struct ConfigOverrides {
    std::set<std::string> disabled;  // feature flag names, e.g. "cost", "line2"
    bool no_color = false;
};

class Config {
public:
    struct FeatureKey {
        const char* env_key;   // STATUSLINE_SHOW_COST
        const char* flag;      // cost  (--no-cost)
        bool AppConfig::*field;
    };

    Config();
    ~Config();

    /// Resolve defaults < config file < environment < overrides.
    /// Returns true if the config file was found and read.
    bool load(const ConfigOverrides& overrides = {});

    AppConfig& data();
    const AppConfig& data() const;

    static std::string config_dir();
    static std::string config_path();

    /// Parse a KEY=value file. '#' lines, blank lines and lines without '=' are skipped.
    static std::map<std::string, std::string> load_env_file(const std::string& path);

    /// The eleven feature keys in display order
    static const std::vector<FeatureKey>& feature_keys();

    static bool is_valid_flag(const std::string& flag);

private:
    AppConfig config_;
};
