#include "cache/usage_cache.hpp"
#include "core/format.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

static const char* const CACHE_SUBDIR = "claude-code-statusline";

long long ModelStats::max_out() const {
    return std::max({opus_out, sonnet_out, haiku_out});
}

// ════════════════════════════════════════════════════════════════
// Paths
// ════════════════════════════════════════════════════════════════

std::string UsageCache::cache_dir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/" + CACHE_SUBDIR;
    }
    const char* home = std::getenv("HOME");
    std::string home_dir = home ? home : "";
    return home_dir + "/.cache/" + CACHE_SUBDIR;
}

std::string UsageCache::project_hash(const std::string& project_dir) {
    std::string slug = project_dir;
    if (!slug.empty() && slug[0] == '/') slug.erase(0, 1);
    std::replace(slug.begin(), slug.end(), '/', '-');
    slug += "\n";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(slug.data(), slug.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        return "";
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len && i < 4; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string UsageCache::session_id_from_transcript(const std::string& transcript_path) {
    if (transcript_path.empty()) return "";
    return fs::path(transcript_path).stem().string();
}

std::string UsageCache::global_cache_path(const std::string& dir) {
    return dir + "/all.json";
}

std::string UsageCache::project_cache_path(const std::string& dir, const std::string& project_dir) {
    return dir + "/proj-" + project_hash(project_dir) + ".json";
}

std::string UsageCache::models_cache_path(const std::string& dir, const std::string& session_id) {
    return dir + "/models-" + session_id + ".json";
}

// ════════════════════════════════════════════════════════════════
// Read path
// ════════════════════════════════════════════════════════════════

std::string UsageCache::read_file(const std::string& path) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin.is_open()) return "";
    std::ostringstream oss;
    oss << fin.rdbuf();
    return oss.str();
}

static long long int_value(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return Format::clamp_count(it->get<double>());
}

static double cost_value(const json& root, const char* window) {
    auto it = root.find(window);
    if (it == root.end() || !it->is_object()) return 0;
    auto cost = it->find("cost");
    if (cost == it->end() || !cost->is_number()) return 0;
    return cost->get<double>();
}

std::optional<ModelStats> UsageCache::parse_models(const std::string& text) {
    json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!root.is_object()) return std::nullopt;

    ModelStats stats;
    auto models = root.find("models");
    if (models == root.end() || !models->is_array()) return stats;

    try {
        for (const auto& m : *models) {
            if (!m.is_object()) continue;
            auto name_it = m.find("model");
            if (name_it == m.end() || !name_it->is_string()) continue;
            const std::string name = name_it->get<std::string>();

            long long in = int_value(m, "in");
            long long out = int_value(m, "out");
            if (name.find("opus") != std::string::npos) {
                stats.opus_in = Format::add_counts(stats.opus_in, in);
                stats.opus_out = Format::add_counts(stats.opus_out, out);
            } else if (name.find("sonnet") != std::string::npos) {
                stats.sonnet_in = Format::add_counts(stats.sonnet_in, in);
                stats.sonnet_out = Format::add_counts(stats.sonnet_out, out);
            } else if (name.find("haiku") != std::string::npos) {
                stats.haiku_in = Format::add_counts(stats.haiku_in, in);
                stats.haiku_out = Format::add_counts(stats.haiku_out, out);
            }
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return stats;
}

std::optional<ModelStats> UsageCache::read_models(const std::string& dir, const std::string& session_id) {
    if (dir.empty() || session_id.empty()) return std::nullopt;
    std::string path = models_cache_path(dir, session_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    return parse_models(read_file(path));
}

std::optional<CumulativeStats> UsageCache::parse_cumulative(const std::string& text) {
    json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!root.is_object()) return std::nullopt;

    CumulativeStats stats;
    stats.d1 = cost_value(root, "d1");
    stats.d7 = cost_value(root, "d7");
    stats.d30 = cost_value(root, "d30");
    if (stats.d1 == 0 && stats.d7 == 0 && stats.d30 == 0) return std::nullopt;
    return stats;
}

std::optional<CumulativeStats> UsageCache::read_cumulative(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return std::nullopt;
    return parse_cumulative(read_file(path));
}

// ════════════════════════════════════════════════════════════════
// Write path
// ════════════════════════════════════════════════════════════════

bool UsageCache::write_atomic(const std::string& path, const std::string& content) {
    std::string tmp = path + ".tmp." + std::to_string(getpid());

    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
        if (!fout.is_open()) return false;
        fout << content;
        fout.close();
        if (fout.fail()) {
            std::remove(tmp.c_str());
            return false;
        }

        // rename(2) replaces the target in one step on the same filesystem
        fs::rename(tmp, path);
        return true;
    } catch (const std::exception&) {
        std::remove(tmp.c_str());
        return false;
    }
}
