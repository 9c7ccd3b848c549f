/*
 * ToolGate C++ - Configuration Implementation
 */
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace toolgate {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

Config Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    try {
        return parse(content.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

Config Config::parse(const std::string& text) {
    Json root;
    try {
        root = Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }
    return Config(root);
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::ensure(const std::string& key) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return default_val;
    return node->get<int64_t>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return default_val;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key,
                                                 const std::vector<std::string>& default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_array()) return default_val;

    std::vector<std::string> out;
    for (Json::const_iterator it = node->begin(); it != node->end(); ++it) {
        if (it->is_string()) {
            out.push_back(it->get<std::string>());
        }
    }
    return out;
}

Json Config::section(const std::string& key) const {
    const Json* node = find(key);
    return node ? *node : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    ensure(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    ensure(key) = value;
}

} // namespace toolgate
