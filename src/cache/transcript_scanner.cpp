#include "cache/transcript_scanner.hpp"
#include "cache/usage_cache.hpp"
#include "core/format.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

static const char* const MODEL_PREFIX = "claude-";

static long long usage_field(const json& usage, const char* key) {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_number()) return 0;
    return Format::clamp_count(it->get<double>());
}

std::vector<std::string> TranscriptScanner::files_for(const std::string& transcript_path,
                                                      const std::string& session_id) {
    std::vector<std::string> files;
    if (transcript_path.empty()) return files;
    files.push_back(transcript_path);

    if (session_id.empty()) return files;

    fs::path subagents = fs::path(transcript_path).parent_path() / session_id / "subagents";
    std::error_code ec;
    if (!fs::is_directory(subagents, ec)) return files;

    std::vector<std::string> extra;
    for (fs::directory_iterator it(subagents, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".jsonl") {
            extra.push_back(it->path().string());
        }
    }
    std::sort(extra.begin(), extra.end());
    files.insert(files.end(), extra.begin(), extra.end());
    return files;
}

bool TranscriptScanner::accumulate_line(const std::string& line, std::vector<ModelUsage>& usage) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return false;

    json entry = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (!entry.is_object()) return false;

    auto type = entry.find("type");
    if (type == entry.end() || !type->is_string() || *type != "assistant") return false;

    auto message = entry.find("message");
    if (message == entry.end() || !message->is_object()) return false;

    auto model = message->find("model");
    auto counters = message->find("usage");
    if (model == message->end() || !model->is_string()) return false;
    if (counters == message->end() || !counters->is_object() || counters->empty()) return false;

    const std::string name = model->get<std::string>();
    if (name.compare(0, std::string(MODEL_PREFIX).size(), MODEL_PREFIX) != 0) return false;

    auto slot = std::find_if(usage.begin(), usage.end(),
                             [&](const ModelUsage& m) { return m.model == name; });
    if (slot == usage.end()) {
        usage.push_back(ModelUsage{name, 0, 0});
        slot = usage.end() - 1;
    }

    long long in = Format::add_counts(usage_field(*counters, "input_tokens"),
                                      usage_field(*counters, "cache_read_input_tokens"));
    in = Format::add_counts(in, usage_field(*counters, "cache_creation_input_tokens"));
    slot->in = Format::add_counts(slot->in, in);
    slot->out = Format::add_counts(slot->out, usage_field(*counters, "output_tokens"));
    return true;
}

std::vector<ModelUsage> TranscriptScanner::scan(const std::vector<std::string>& files) {
    std::vector<ModelUsage> usage;

    for (const auto& path : files) {
        std::ifstream fin(path);
        if (!fin.is_open()) continue;

        std::string line;
        while (std::getline(fin, line)) {
            try {
                accumulate_line(line, usage);
            } catch (const std::exception&) {
                // One bad line never spoils the rest of the transcript
            }
        }
    }

    std::sort(usage.begin(), usage.end(),
              [](const ModelUsage& a, const ModelUsage& b) { return a.model < b.model; });
    return usage;
}

std::string TranscriptScanner::to_json(const std::vector<ModelUsage>& models) {
    json list = json::array();
    for (const auto& m : models) {
        list.push_back({{"model", m.model}, {"in", m.in}, {"out", m.out}});
    }
    json root;
    root["models"] = list;
    return root.dump();
}

bool TranscriptScanner::refresh(const std::string& session_id,
                                const std::string& transcript_path,
                                const std::string& cache_dir) {
    if (session_id.empty() || transcript_path.empty() || cache_dir.empty()) return false;

    try {
        auto models = scan(files_for(transcript_path, session_id));
        return UsageCache::write_atomic(UsageCache::models_cache_path(cache_dir, session_id),
                                        to_json(models));
    } catch (const std::exception&) {
        return false;
    }
}
