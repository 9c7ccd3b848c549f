/*
 * ToolGate C++ - Filesystem path sanitizer
 *
 * Resolves user supplied paths, rejects traversal out of an allowed root,
 * protected system locations and anything outside the allowed base
 * directories. Symlinks are resolved and the real path re-validated.
 * Secret file detection blocks reads of credentials even on permitted paths.
 */
#ifndef toolgate_SAFETY_PATHS_HPP
#define toolgate_SAFETY_PATHS_HPP

#include <string>
#include <vector>

namespace toolgate {

class Config;

struct PathCheck {
    bool safe;
    std::string reason;
    std::string resolved_path;   // Absolute, symlink-free; set when safe

    PathCheck() : safe(false) {}
};

struct SecretCheck {
    bool blocked;
    std::string reason;

    SecretCheck() : blocked(false) {}
};

struct PathPolicy {
    std::vector<std::string> allowed_base_dirs;
    // Trailing "/" means the directory and everything beneath it,
    // otherwise a prefix match ("/etc/shadow" also covers "/etc/shadow-").
    std::vector<std::string> protected_paths;

    static PathPolicy defaults();

    // safety.allowed_base_dirs / safety.protected_paths, falling back to defaults
    static PathPolicy from_config(const Config& config);
};

// Uses PathPolicy::defaults()
PathCheck sanitize_path(const std::string& path, const std::string& allowed_root = "");
PathCheck sanitize_path(const std::string& path, const std::string& allowed_root,
                        const PathPolicy& policy);

// True when the basename, an extension pattern or a directory segment
// marks the file as likely to hold credentials. Case-insensitive.
bool is_secret_file(const std::string& path);

SecretCheck check_secret_file(const std::string& path);

} // namespace toolgate

#endif // toolgate_SAFETY_PATHS_HPP
