/*
 * ToolGate C++ - Configuration
 *
 * JSON configuration with dotted-key access ("audit.db_path").
 * Missing keys and type mismatches return the supplied default.
 */
#ifndef toolgate_CORE_CONFIG_HPP
#define toolgate_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

namespace toolgate {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Load from a JSON file. Throws ConfigError on unreadable or invalid JSON.
    static Config load_file(const std::string& path);

    // Parse from a JSON string. Throws ConfigError on invalid JSON.
    static Config parse(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key,
                                             const std::vector<std::string>& default_val) const;

    // Raw sub-tree; null Json if missing
    Json section(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);

    const Json& root() const { return root_; }

private:
    Json root_;

    const Json* find(const std::string& key) const;
    Json& ensure(const std::string& key);
};

} // namespace toolgate

#endif // toolgate_CORE_CONFIG_HPP
