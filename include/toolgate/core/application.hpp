/*
 * ToolGate C++ - Application
 *
 * Central singleton: loads configuration, sets up logging, the audit
 * store, action providers and the registry, then runs one CLI command.
 */
#ifndef toolgate_CORE_APPLICATION_HPP
#define toolgate_CORE_APPLICATION_HPP

#include <toolgate/core/config.hpp>
#include <toolgate/core/registry.hpp>
#include <toolgate/core/provider.hpp>
#include <toolgate/audit/store.hpp>
#include <toolgate/safety/keyword.hpp>
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace toolgate {

struct AppInfo {
    static constexpr const char* NAME = "ToolGate";
    static constexpr const char* VERSION = "1.0.0";
};

// Process exit codes
enum ExitCode {
    EXIT_CODE_OK = 0,
    EXIT_CODE_ERROR = 1,
    EXIT_CODE_BLOCKED = 2
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    // False when the process should exit right away (help, version, bad
    // arguments, fatal configuration); exit_code() tells with which code.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    ToolRegistry& registry() { return registry_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    void setup_audit();
    bool setup_registry();

    int cmd_list();
    int cmd_prompt();
    int cmd_exec();
    int cmd_audit();

    Config config_;
    std::string config_file_;
    bool config_explicit_;
    std::string prog_;

    std::string command_;

    // exec
    std::string exec_action_;
    std::string exec_args_;
    Source exec_source_;
    bool exec_override_;
    int exec_confirms_;
    std::string exec_keyword_;
    bool json_output_;

    // audit
    int64_t audit_since_;
    int64_t audit_until_;
    int audit_limit_;

    ToolRegistry registry_;
    SqliteAuditStore audit_store_;
    KeywordApproval keyword_;
    std::vector<std::unique_ptr<ActionProvider>> providers_;
    int exit_code_;
};

} // namespace toolgate

#endif // toolgate_CORE_APPLICATION_HPP
