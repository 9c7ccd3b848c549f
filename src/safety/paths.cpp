/*
 * ToolGate C++ - Filesystem path sanitizer
 */
#include <toolgate/safety/paths.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

#include <sys/stat.h>
#include <climits>
#include <cstdlib>

namespace toolgate {

// ============================================================================
// Policy
// ============================================================================

PathPolicy PathPolicy::defaults() {
    PathPolicy p;
    p.allowed_base_dirs.push_back("/root");
    p.allowed_base_dirs.push_back("/opt");
    p.allowed_base_dirs.push_back("/tmp");
    p.allowed_base_dirs.push_back("/home");
    p.allowed_base_dirs.push_back("/mnt");
    p.allowed_base_dirs.push_back("/var/lib");
    p.allowed_base_dirs.push_back("/srv");
    p.allowed_base_dirs.push_back("/var/log");

    p.protected_paths.push_back("/etc/pve/priv/");
    p.protected_paths.push_back("/root/.ssh/");
    p.protected_paths.push_back("/etc/shadow");
    p.protected_paths.push_back("/etc/passwd");
    p.protected_paths.push_back("/etc/sudoers");
    p.protected_paths.push_back("/proc/");
    p.protected_paths.push_back("/sys/");
    p.protected_paths.push_back("/dev/");
    p.protected_paths.push_back("/boot/");
    p.protected_paths.push_back("/etc/pve/local/");
    return p;
}

PathPolicy PathPolicy::from_config(const Config& config) {
    PathPolicy defaults_policy = defaults();
    PathPolicy p;
    p.allowed_base_dirs = config.get_string_list("safety.allowed_base_dirs",
                                                 defaults_policy.allowed_base_dirs);
    p.protected_paths = config.get_string_list("safety.protected_paths",
                                               defaults_policy.protected_paths);
    for (size_t i = 0; i < p.allowed_base_dirs.size(); ++i) {
        p.allowed_base_dirs[i] = normalize_path(expand_home(p.allowed_base_dirs[i]));
    }
    return p;
}

// ============================================================================
// Helpers
// ============================================================================

static bool path_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

static bool real_path(const std::string& path, std::string& out) {
    char buf[PATH_MAX];
    if (!realpath(path.c_str(), buf)) return false;
    out = buf;
    return true;
}

// Returns the matching protected entry, or empty.
static std::string match_protected(const std::string& path, const PathPolicy& policy) {
    for (size_t i = 0; i < policy.protected_paths.size(); ++i) {
        const std::string& entry = policy.protected_paths[i];
        if (entry.empty()) continue;
        if (entry[entry.size() - 1] == '/') {
            std::string dir = entry.size() > 1 ? entry.substr(0, entry.size() - 1) : entry;
            if (is_within_dir(path, dir)) return entry;
        } else if (starts_with(path, entry)) {
            return entry;
        }
    }
    return "";
}

static bool in_allowed_dirs(const std::string& path, const PathPolicy& policy) {
    for (size_t i = 0; i < policy.allowed_base_dirs.size(); ++i) {
        if (is_within_dir(path, policy.allowed_base_dirs[i])) return true;
    }
    return false;
}

// Protected / root containment / base directory checks on one absolute path.
static bool validate_resolved(const std::string& path, const std::string& root,
                              const PathPolicy& policy, const std::string& shown,
                              PathCheck& check) {
    std::string hit = match_protected(path, policy);
    if (!hit.empty()) {
        LOG_WARN("Protected path blocked: %s (matches %s)", path.c_str(), hit.c_str());
        check.reason = "Cannot access " + shown + ": that path is protected";
        return false;
    }
    if (!root.empty() && !is_within_dir(path, root)) {
        LOG_WARN("Path traversal blocked: %s escapes %s", path.c_str(), root.c_str());
        check.reason = "Cannot access " + shown + ": it is outside the allowed directory";
        return false;
    }
    if (!in_allowed_dirs(path, policy)) {
        LOG_WARN("Path outside allowed base directories: %s", path.c_str());
        check.reason = "Cannot access " + shown + ": it is outside the allowed directories";
        return false;
    }
    return true;
}

// ============================================================================
// sanitize_path
// ============================================================================

PathCheck sanitize_path(const std::string& path, const std::string& allowed_root) {
    static const PathPolicy policy = PathPolicy::defaults();
    return sanitize_path(path, allowed_root, policy);
}

PathCheck sanitize_path(const std::string& path, const std::string& allowed_root,
                        const PathPolicy& policy) {
    PathCheck check;

    if (path.find('\0') != std::string::npos) {
        check.reason = "Path contains a NUL byte";
        return check;
    }
    if (trim(path).empty()) {
        check.reason = "Path is empty";
        return check;
    }

    std::string decoded;
    if (!percent_decode(path, decoded) || decoded.find('\0') != std::string::npos) {
        check.reason = "Path contains invalid encoding";
        return check;
    }
    if (!is_valid_utf8(decoded)) {
        check.reason = "Path is not valid UTF-8";
        return check;
    }
    // Output must not decode any further, so double encoding is refused.
    if (decoded.find('%') != std::string::npos) {
        check.reason = "Path contains a double-encoded escape";
        return check;
    }

    std::string root;
    if (!allowed_root.empty()) {
        root = normalize_path(allowed_root[0] == '/' ? allowed_root : "/" + allowed_root);
    }
    std::string base = root.empty() ? std::string("/") : root;
    std::string resolved = normalize_path(decoded[0] == '/' ? decoded : join_path(base, decoded));

    if (!validate_resolved(resolved, root, policy, resolved, check)) {
        return check;
    }

    // Symlink pass: compare real paths against the real root.
    std::string real_root = root;
    if (!root.empty() && path_exists(root) && !real_path(root, real_root)) {
        check.reason = "Cannot resolve allowed root " + root;
        return check;
    }

    std::string real;
    if (path_exists(resolved)) {
        if (!real_path(resolved, real)) {
            check.reason = "Cannot resolve " + resolved;
            return check;
        }
    } else {
        // Resolve the nearest existing ancestor and re-attach the missing tail.
        std::string ancestor = parent_path(resolved);
        std::string tail = base_name(resolved);
        while (ancestor != "/" && !path_exists(ancestor)) {
            tail = join_path(base_name(ancestor), tail);
            ancestor = parent_path(ancestor);
        }
        std::string real_ancestor;
        if (!real_path(ancestor, real_ancestor)) {
            check.reason = "Cannot resolve parent directory of " + resolved;
            return check;
        }
        real = normalize_path(join_path(real_ancestor, tail));
    }

    if (real != resolved) {
        LOG_DEBUG("Path %s resolves to %s", resolved.c_str(), real.c_str());
        if (!validate_resolved(real, real_root, policy, resolved + " (resolves to " + real + ")",
                               check)) {
            return check;
        }
    }

    check.safe = true;
    check.resolved_path = real;
    return check;
}

// ============================================================================
// Secret files
// ============================================================================

namespace {

const char* const SECRET_FILENAMES[] = {
    ".env", ".env.local", ".env.production", ".env.development", ".env.staging",
    ".env.test", ".env.example", ".npmrc", ".pypirc", ".netrc", ".pgpass", ".my.cnf",
    ".s3cfg", "credentials", "credentials.json", "service-account.json",
    "service_account.json", "keyfile.json", "secrets.json", "secrets.yaml", "secrets.yml",
    "vault.json", "vault.yaml", "vault.yml", ".htpasswd", "shadow", "master.key",
    "token.json",
};

const char* const SECRET_PREFIXES[] = {
    ".env.",
};

const char* const SECRET_SUFFIXES[] = {
    "_rsa", "_rsa.pub", "_ed25519", "_ed25519.pub", "_ecdsa", "_dsa",
    ".pem", ".key", ".p12", ".pfx", ".jks", ".keystore",
};

const char* const SECRET_DIR_SEGMENTS[] = {
    ".git", ".ssh", ".gnupg", ".docker", ".kube", ".aws", ".azure", ".gcloud",
};

#define TG_COUNT(arr) (sizeof(arr) / sizeof((arr)[0]))

} // anonymous namespace

SecretCheck check_secret_file(const std::string& path) {
    SecretCheck check;
    std::string name = to_lower(base_name(path));

    bool hit = false;
    for (size_t i = 0; i < TG_COUNT(SECRET_FILENAMES) && !hit; ++i) {
        hit = (name == SECRET_FILENAMES[i]);
    }
    for (size_t i = 0; i < TG_COUNT(SECRET_PREFIXES) && !hit; ++i) {
        hit = starts_with(name, SECRET_PREFIXES[i]);
    }
    for (size_t i = 0; i < TG_COUNT(SECRET_SUFFIXES) && !hit; ++i) {
        hit = ends_with(name, SECRET_SUFFIXES[i]);
    }
    if (hit) {
        LOG_WARN("Secret file blocked: %s", path.c_str());
        check.blocked = true;
        check.reason = "Cannot read " + base_name(path) + ": it may contain secrets or credentials";
        return check;
    }

    std::vector<std::string> segments = split(path, '/');
    for (size_t s = 0; s < segments.size(); ++s) {
        std::string seg = to_lower(segments[s]);
        for (size_t i = 0; i < TG_COUNT(SECRET_DIR_SEGMENTS); ++i) {
            if (seg == SECRET_DIR_SEGMENTS[i]) {
                LOG_WARN("Secret directory blocked: %s", path.c_str());
                check.blocked = true;
                check.reason = std::string("Cannot read files inside ") + SECRET_DIR_SEGMENTS[i] +
                               "/: that directory may contain sensitive data";
                return check;
            }
        }
    }
    return check;
}

bool is_secret_file(const std::string& path) {
    return check_secret_file(path).blocked;
}

#undef TG_COUNT

} // namespace toolgate
