/*
 * ToolGate C++ - Built-in actions
 *
 * Handlers receive arguments that already passed the dispatcher's schema
 * check and sanitizers; paths arrive resolved and symlink-free.
 */
#include <toolgate/core/builtin_actions.hpp>
#include <toolgate/core/registry.hpp>
#include <toolgate/core/config.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <sys/stat.h>
#include <sys/wait.h>
#include <dirent.h>
#include <unistd.h>

namespace toolgate {

static const size_t MAX_READ_SIZE = 50000;
static const size_t MAX_OUTPUT = 100000;

BuiltinActionsProvider::BuiltinActionsProvider()
    : shell_timeout_(20)
    , url_policy_(UrlPolicy::defaults())
    , registry_(nullptr)
    , initialized_(false) {}

BuiltinActionsProvider::~BuiltinActionsProvider() {}

bool BuiltinActionsProvider::init(const Config& cfg) {
    workspace_dir_ = normalize_path(expand_home(cfg.get_string("workspace_dir", "~/.toolgate/workspace")));
    shell_timeout_ = static_cast<int>(cfg.get_int("builtin.shell_timeout", 20));
    url_policy_ = UrlPolicy::from_config(cfg);

    if (!create_parent_directory(join_path(workspace_dir_, ".keep"))) {
        LOG_WARN("Cannot create workspace directory %s", workspace_dir_.c_str());
    }

    LOG_INFO("Builtin actions initialized (workspace=%s, shell_timeout=%ds)",
             workspace_dir_.c_str(), shell_timeout_);

    initialized_ = true;
    return true;
}

void BuiltinActionsProvider::shutdown() {
    registry_ = nullptr;
    initialized_ = false;
}

void BuiltinActionsProvider::register_actions(ToolRegistry& registry) {
    registry_ = &registry;

    registry.register_action(
        ActionSpec("list_directory", "List the entries of a directory", Tier::AUTO)
            .param(ParamSchema("path", "string", "Directory to list", true, ParamFormat::PATH)),
        [this](const Json& args, const CallContext&) { return do_list_directory(args); });

    registry.register_action(
        ActionSpec("get_file_info", "Size, type, permissions and modification time of a path",
                   Tier::AUTO)
            .param(ParamSchema("path", "string", "File or directory", true, ParamFormat::PATH)),
        [this](const Json& args, const CallContext&) { return do_get_file_info(args); });

    registry.register_action(
        ActionSpec("read_file", "Read a text file (credential files are refused)", Tier::AUTO)
            .param(ParamSchema("path", "string", "File to read", true, ParamFormat::SECRET_PATH)),
        [this](const Json& args, const CallContext&) { return do_read_file(args); });

    registry.register_action(
        ActionSpec("run_command", "Run an allow-listed shell command on this host", Tier::CONFIRM)
            .param(ParamSchema("command", "string", "Command line", true, ParamFormat::COMMAND))
            .param(ParamSchema("confirmed", "boolean", "Operator confirmed the command")),
        [this](const Json& args, const CallContext& ctx) { return do_run_command(args, ctx); });

    registry.register_action(
        ActionSpec("check_url", "Check that a URL is safe to fetch and report its address",
                   Tier::AUTO)
            .param(ParamSchema("url", "string", "http or https URL", true, ParamFormat::URL)),
        [this](const Json& args, const CallContext&) { return do_check_url(args); });

    registry.register_action(
        ActionSpec("list_actions", "List every registered action with its tier", Tier::AUTO),
        [this](const Json&, const CallContext&) { return do_list_actions(); });
}

// ============================================================================
// Filesystem
// ============================================================================

ToolResult BuiltinActionsProvider::do_list_directory(const Json& args) const {
    std::string dir_path = args["path"].get<std::string>();

    DIR* dir = opendir(dir_path.c_str());
    if (!dir) {
        return ToolResult::fail("Cannot open directory: " + dir_path + " (" + strerror(errno) + ")");
    }

    std::vector<std::string> names;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    }
    closedir(dir);
    std::sort(names.begin(), names.end());

    std::ostringstream result;
    result << "Contents of " << dir_path << ":\n";
    Json entries = Json::array();

    for (size_t i = 0; i < names.size(); ++i) {
        std::string entry_path = join_path(dir_path, names[i]);
        Json item;
        item["name"] = names[i];

        struct stat st;
        if (lstat(entry_path.c_str(), &st) == 0) {
            if (S_ISDIR(st.st_mode)) {
                result << "  " << names[i] << "/\n";
                item["type"] = "dir";
            } else if (S_ISLNK(st.st_mode)) {
                result << "  " << names[i] << "@\n";
                item["type"] = "link";
            } else {
                result << "  " << names[i] << " (" << st.st_size << " bytes)\n";
                item["type"] = "file";
                item["size"] = static_cast<int64_t>(st.st_size);
            }
        } else {
            result << "  " << names[i] << "\n";
        }
        entries.push_back(item);
    }

    if (names.empty()) {
        result << "  (empty)\n";
    }

    Json data;
    data["path"] = dir_path;
    data["entries"] = entries;
    return ToolResult::ok(result.str(), data);
}

ToolResult BuiltinActionsProvider::do_get_file_info(const Json& args) const {
    std::string path = args["path"].get<std::string>();

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return ToolResult::fail("Cannot stat " + path + ": " + strerror(errno));
    }

    const char* type = S_ISDIR(st.st_mode) ? "dir" : (S_ISREG(st.st_mode) ? "file" : "other");
    char mode[8];
    snprintf(mode, sizeof(mode), "%04o", static_cast<unsigned>(st.st_mode & 07777));
    int64_t mtime_ms = static_cast<int64_t>(st.st_mtime) * 1000;

    Json data;
    data["path"] = path;
    data["type"] = type;
    data["size"] = static_cast<int64_t>(st.st_size);
    data["mode"] = mode;
    data["uid"] = static_cast<int64_t>(st.st_uid);
    data["gid"] = static_cast<int64_t>(st.st_gid);
    data["modified"] = format_timestamp_ms(mtime_ms);

    std::ostringstream out;
    out << path << ": " << type << ", " << st.st_size << " bytes, mode " << mode
        << ", modified " << format_timestamp_ms(mtime_ms);
    return ToolResult::ok(out.str(), data);
}

ToolResult BuiltinActionsProvider::do_read_file(const Json& args) const {
    std::string path = args["path"].get<std::string>();

    struct stat st;
    if (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        return ToolResult::fail(path + " is a directory; use list_directory");
    }

    std::ifstream file(path.c_str(), std::ios::binary);
    if (!file.is_open()) {
        return ToolResult::fail("Cannot open file: " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    std::string result = content.str();

    if (result.size() > MAX_READ_SIZE) {
        result = truncate_safe(result, MAX_READ_SIZE) + "\n\n... [truncated, file too large] ...";
    }
    return ToolResult::ok(result);
}

// ============================================================================
// Shell
// ============================================================================

// Wrap in single quotes for sh -c
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\'') {
            out += "'\\''";
        } else {
            out += s[i];
        }
    }
    out += "'";
    return out;
}

ToolResult BuiltinActionsProvider::do_run_command(const Json& args, const CallContext& ctx) const {
    std::string command = args["command"].get<std::string>();
    std::string workdir = workspace_dir_.empty() ? std::string("/tmp") : workspace_dir_;

    LOG_INFO("[run_command] Executing: %s (in %s%s)", command.c_str(), workdir.c_str(),
             ctx.override_active ? ", override" : "");

    std::ostringstream full_cmd;
    full_cmd << "cd " << shell_quote(workdir) << " && ";
    if (shell_timeout_ > 0) {
        full_cmd << "timeout " << shell_timeout_ << " ";
    }
    full_cmd << "sh -c " << shell_quote(command) << " 2>&1";

    FILE* pipe = popen(full_cmd.str().c_str(), "r");
    if (!pipe) {
        return ToolResult::fail(std::string("Failed to execute command: ") + strerror(errno));
    }

    std::string output;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        if (output.size() < MAX_OUTPUT) output += buffer;
    }
    int status = pclose(pipe);

    bool truncated = output.size() >= MAX_OUTPUT;
    if (truncated) {
        output = truncate_safe(output, MAX_OUTPUT) + "\n... [output truncated] ...";
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    Json data;
    data["command"] = command;
    data["exit_code"] = exit_code;
    data["truncated"] = truncated;

    if (exit_code == 124) {
        std::ostringstream err;
        err << "Command timed out after " << shell_timeout_ << " seconds.";
        if (!output.empty()) err << " Partial output:\n" << output;
        ToolResult r = ToolResult::fail(err.str());
        r.data = data;
        return r;
    }

    // Non-zero exits still return the output so the caller can react to it.
    if (exit_code != 0) {
        std::ostringstream err;
        err << "Command exited with code " << exit_code;
        if (!output.empty()) err << ":\n" << output;
        return ToolResult::ok(err.str(), data);
    }

    return ToolResult::ok(output.empty() ? "(no output)" : output, data);
}

// ============================================================================
// URL / registry
// ============================================================================

ToolResult BuiltinActionsProvider::do_check_url(const Json& args) const {
    std::string url = args["url"].get<std::string>();
    UrlCheck check = validate_url(url, resolver_, url_policy_);
    if (!check.safe) {
        return ToolResult::fail(check.reason);
    }

    Json data;
    data["url"] = url;
    data["host"] = check.host;
    data["resolved_ip"] = check.resolved_ip;
    return ToolResult::ok(url + " is safe to fetch (" + check.host + " -> " + check.resolved_ip + ")",
                          data);
}

ToolResult BuiltinActionsProvider::do_list_actions() const {
    if (!registry_) {
        return ToolResult::fail("Registry not available");
    }

    std::vector<ActionInfo> list = registry_->get_action_list();
    std::ostringstream out;
    Json data = Json::array();
    for (size_t i = 0; i < list.size(); ++i) {
        out << list[i].name << " [" << tier_to_string(list[i].tier) << "]\n";
        Json item;
        item["name"] = list[i].name;
        item["tier"] = tier_to_string(list[i].tier);
        data.push_back(item);
    }
    return ToolResult::ok(out.str(), data);
}

} // namespace toolgate
