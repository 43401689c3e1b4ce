/**
 * @file config.cpp
 * @brief JSON config file loading
 */

#include "soon/config.h"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace soon {

namespace {

const json* find_setting(const json& root, const char* section, const char* key) {
    auto sec = root.find(section);
    if (sec != root.end() && sec->is_object()) {
        auto it = sec->find(key);
        if (it != sec->end()) {
            return &*it;
        }
    }
    auto it = root.find(key);
    if (it != root.end()) {
        return &*it;
    }
    return nullptr;
}

bool try_get_int(const json& root, const char* section, const char* key, int& out) {
    const json* value = find_setting(root, section, key);
    if (value && value->is_number_integer()) {
        out = value->get<int>();
        return true;
    }
    return false;
}

bool try_get_bool(const json& root, const char* section, const char* key, bool& out) {
    const json* value = find_setting(root, section, key);
    if (value && value->is_boolean()) {
        out = value->get<bool>();
        return true;
    }
    return false;
}

} // anonymous namespace

std::string default_config_path() {
    const char* env_config = std::getenv("SOON_CONFIG_PATH");
    if (env_config && std::strlen(env_config) > 0) {
        return std::string(env_config);
    }
#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\soon\\config.json";
    }
    return "C:\\soon\\config.json";
#else
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && std::strlen(xdg) > 0) {
        return std::string(xdg) + "/soon/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/soon/config.json";
    }
    return "/tmp/soon/config.json";
#endif
}

void apply_config(const json& root, CodecConfig& config) {
    if (!root.is_object()) {
        return;
    }

    try_get_bool(root, "decode", "allow_duplicate_keys", config.decode.allow_duplicate_keys);
    try_get_int(root, "decode", "max_depth", config.decode.max_depth);
    try_get_bool(root, "decode", "strict", config.decode.strict);

    try_get_int(root, "encode", "indent", config.encode.indent);
    try_get_bool(root, "encode", "sort_keys", config.encode.sort_keys);
    try_get_bool(root, "encode", "compact", config.encode.compact);

    if (root.contains("verbose") && root["verbose"].is_boolean()) {
        config.verbose = root["verbose"].get<bool>();
    }
}

bool load_config_file(const std::string& path, CodecConfig& config, std::string& error) {
    if (path.empty()) return false;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        error = "Failed to open config file: " + path;
        return false;
    }
    json root;
    try {
        in >> root;
    } catch (const std::exception& e) {
        error = std::string("Failed to parse config file: ") + e.what();
        return false;
    }
    apply_config(root, config);
    return true;
}

} // namespace soon
