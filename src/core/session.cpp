#include "core/session.hpp"

#include <nlohmann/json.hpp>

#include <iterator>

using json = nlohmann::json;

static const json& child(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.is_object()) return empty;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return empty;
    return *it;
}

static double number_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return it->get<double>();
}

static std::string string_field(const json& j, const char* key) {
    if (!j.is_object()) return "";
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

SessionSnapshot SessionSnapshot::parse(const std::string& text) {
    SessionSnapshot s;

    json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!root.is_object()) return s;

    try {
        s.session_id = string_field(root, "session_id");
        s.cwd = string_field(root, "cwd");
        s.version = string_field(root, "version");
        s.transcript_path = string_field(root, "transcript_path");

        const json& model = child(root, "model");
        s.model_id = string_field(model, "id");
        s.model_display_name = string_field(model, "display_name");
        auto name = model.find("display_name");
        s.has_model_display_name = name != model.end() && name->is_string();

        const json& cost = child(root, "cost");
        s.total_cost_usd = number_field(cost, "total_cost_usd");
        s.total_duration_ms = number_field(cost, "total_duration_ms");
        s.total_api_duration_ms = number_field(cost, "total_api_duration_ms");
        s.total_lines_added = number_field(cost, "total_lines_added");
        s.total_lines_removed = number_field(cost, "total_lines_removed");

        const json& ctx = child(root, "context_window");
        s.used_percentage = number_field(ctx, "used_percentage");
        s.context_window_size = number_field(ctx, "context_window_size");
        s.total_input_tokens = number_field(ctx, "total_input_tokens");
        s.total_output_tokens = number_field(ctx, "total_output_tokens");

        const json& ws = child(root, "workspace");
        s.project_dir = string_field(ws, "project_dir");
        s.current_dir = string_field(ws, "current_dir");
    } catch (const std::exception&) {
        return SessionSnapshot{};
    }

    return s;
}

SessionSnapshot SessionSnapshot::parse(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}
