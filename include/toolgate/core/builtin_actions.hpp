/*
 * ToolGate C++ - Built-in actions
 *
 * Local actions that exercise every sanitizer format:
 * - list_directory: directory listing              (auto, path)
 * - get_file_info:  stat a file                    (auto, path)
 * - read_file:      read a file, secrets refused   (auto, secret_path)
 * - run_command:    local shell command            (confirm, command)
 * - check_url:      SSRF check without fetching    (auto, url)
 * - list_actions:   registered actions and tiers   (auto)
 */
#ifndef toolgate_CORE_BUILTIN_ACTIONS_HPP
#define toolgate_CORE_BUILTIN_ACTIONS_HPP

#include "provider.hpp"
#include "types.hpp"
#include "call_context.hpp"
#include <toolgate/safety/urls.hpp>
#include <string>

namespace toolgate {

class BuiltinActionsProvider : public ActionProvider {
public:
    BuiltinActionsProvider();
    virtual ~BuiltinActionsProvider();

    const char* name() const override { return "builtin_actions"; }
    const char* description() const override {
        return "Built-in filesystem, shell and URL actions";
    }

    bool init(const Config& cfg) override;
    void shutdown() override;
    void register_actions(ToolRegistry& registry) override;

    // Resolver used by check_url; empty means the system resolver
    void set_resolver(const HostResolver& resolver) { resolver_ = resolver; }

    const std::string& workspace_dir() const { return workspace_dir_; }

private:
    std::string workspace_dir_;
    int shell_timeout_;
    UrlPolicy url_policy_;
    HostResolver resolver_;
    const ToolRegistry* registry_;
    bool initialized_;

    ToolResult do_list_directory(const Json& args) const;
    ToolResult do_get_file_info(const Json& args) const;
    ToolResult do_read_file(const Json& args) const;
    ToolResult do_run_command(const Json& args, const CallContext& ctx) const;
    ToolResult do_check_url(const Json& args) const;
    ToolResult do_list_actions() const;
};

} // namespace toolgate

#endif // toolgate_CORE_BUILTIN_ACTIONS_HPP
