#include "core/config.hpp"

#include <cstdlib>
#include <fstream>

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

Config::Config() = default;
Config::~Config() = default;

const std::vector<Config::FeatureKey>& Config::feature_keys() {
    static const std::vector<FeatureKey> keys = {
        {"STATUSLINE_SHOW_MODEL",      "model",      &AppConfig::show_model},
        {"STATUSLINE_SHOW_MODEL_BARS", "model-bars", &AppConfig::show_model_bars},
        {"STATUSLINE_SHOW_CONTEXT",    "context",    &AppConfig::show_context},
        {"STATUSLINE_SHOW_COST",       "cost",       &AppConfig::show_cost},
        {"STATUSLINE_SHOW_DURATION",   "duration",   &AppConfig::show_duration},
        {"STATUSLINE_SHOW_GIT",        "git",        &AppConfig::show_git},
        {"STATUSLINE_SHOW_DIFF",       "diff",       &AppConfig::show_diff},
        {"STATUSLINE_LINE2",           "line2",      &AppConfig::line2},
        {"STATUSLINE_SHOW_TOKENS",     "tokens",     &AppConfig::show_tokens},
        {"STATUSLINE_SHOW_SPEED",      "speed",      &AppConfig::show_speed},
        {"STATUSLINE_SHOW_CUMULATIVE", "cumulative", &AppConfig::show_cumulative},
    };
    return keys;
}

bool Config::is_valid_flag(const std::string& flag) {
    for (const auto& key : feature_keys()) {
        if (flag == key.flag) return true;
    }
    return false;
}

std::string Config::config_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.claude";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/statusline.env";
}

std::map<std::string, std::string> Config::load_env_file(const std::string& path) {
    std::map<std::string, std::string> values;
    if (path.empty()) return values;

    std::ifstream fin(path);
    if (!fin.is_open()) return values;

    std::string line;
    while (std::getline(fin, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        values[key] = trim(line.substr(eq + 1));
    }
    return values;
}

bool Config::load(const ConfigOverrides& overrides) {
    config_ = AppConfig{};

    // Tier 1: config file
    std::string path = config_path();
    std::ifstream probe(path);
    bool file_found = !path.empty() && probe.is_open();
    probe.close();
    std::map<std::string, std::string> merged = load_env_file(path);

    // Tier 2: environment replaces file values key by key
    for (const auto& key : feature_keys()) {
        if (const char* v = std::getenv(key.env_key)) {
            merged[key.env_key] = v;
        }
    }

    for (const auto& key : feature_keys()) {
        auto it = merged.find(key.env_key);
        if (it != merged.end() && it->second == "false") {
            config_.*key.field = false;
        }
    }

    // Tier 3: command-line flags always disable
    for (const auto& key : feature_keys()) {
        if (overrides.disabled.count(key.flag)) {
            config_.*key.field = false;
        }
    }

    const char* no_color = std::getenv("NO_COLOR");
    const char* tool_no_color = std::getenv("STATUSLINE_NO_COLOR");
    config_.no_color = overrides.no_color ||
                       (no_color && no_color[0] != '\0') ||
                       (tool_no_color && tool_no_color[0] != '\0');

    return file_found;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
