#include <model_config/settings.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace model_config {

namespace {

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

std::optional<Settings> parse_settings_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    Settings out;
    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& logging = j["logging"];
        read_string(logging, "level", out.log_level);
        read_string(logging, "file", out.log_file);
        read_string(logging, "pattern", out.log_pattern);
    }
    read_string(j, "sample", out.sample);
    return out;
}

} // namespace

std::optional<Settings> load_settings_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_settings_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<Settings> load_settings_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_settings_from_json(f);
}

} // namespace model_config
