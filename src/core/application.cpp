/*
 * ToolGate C++ - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <toolgate/core/application.hpp>
#include <toolgate/core/builtin_actions.hpp>
#include <toolgate/core/logger.hpp>
#include <toolgate/core/utils.hpp>

#include <iostream>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <curl/curl.h>

namespace toolgate {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - tool execution safety gateway\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  list                         List actions and their tiers\n"
              << "  prompt                       Print the capability prompt\n"
              << "  exec <action> [json-args]    Run one action through the gateway\n"
              << "      --source <llm|monitor|user|api>   Caller (default: user)\n"
              << "      --override               Activate override for this call\n"
              << "      --confirm                Confirm (repeat for double confirmation)\n"
              << "      --keyword <phrase>       Approval keyword\n"
              << "      --json                   Print the result as JSON\n"
              << "  audit                        Show audit records\n"
              << "      --since <ms> --until <ms> --limit <n> --json\n\n"
              << "Options:\n"
              << "  --config <path>  Configuration file (default: config.json)\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n\n"
              << "Exit codes: 0 ok, 1 error, 2 blocked\n\n"
              << "Example:\n"
              << "  " << prog << " exec list_directory '{\"path\": \"/tmp\"}'\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

static bool parse_int64(const char* s, int64_t& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    long long v = strtoll(s, &end, 10);
    if (*end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_("config.json")
    , config_explicit_(false)
    , exec_source_(Source::USER)
    , exec_override_(false)
    , exec_confirms_(0)
    , json_output_(false)
    , audit_since_(-1)
    , audit_until_(-1)
    , audit_limit_(50)
    , exit_code_(EXIT_CODE_OK)
{}

bool Application::parse_args(int argc, char* argv[]) {
    prog_ = argc > 0 ? argv[0] : "toolgate";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(prog_.c_str());
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--source") == 0 && i + 1 < argc) {
            if (!source_from_string(argv[++i], exec_source_)) {
                std::cerr << "Unknown source: " << argv[i] << "\n";
                exit_code_ = EXIT_CODE_ERROR;
                return false;
            }
            continue;
        }
        if (strcmp(argv[i], "--override") == 0) {
            exec_override_ = true;
            continue;
        }
        if (strcmp(argv[i], "--confirm") == 0) {
            ++exec_confirms_;
            continue;
        }
        if (strcmp(argv[i], "--keyword") == 0 && i + 1 < argc) {
            exec_keyword_ = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--json") == 0) {
            json_output_ = true;
            continue;
        }
        if ((strcmp(argv[i], "--since") == 0 || strcmp(argv[i], "--until") == 0 ||
             strcmp(argv[i], "--limit") == 0) && i + 1 < argc) {
            const char* flag = argv[i];
            int64_t value = 0;
            if (!parse_int64(argv[++i], value)) {
                std::cerr << "Invalid value for " << flag << ": " << argv[i] << "\n";
                exit_code_ = EXIT_CODE_ERROR;
                return false;
            }
            if (strcmp(flag, "--since") == 0) audit_since_ = value;
            else if (strcmp(flag, "--until") == 0) audit_until_ = value;
            else audit_limit_ = static_cast<int>(value);
            continue;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            exit_code_ = EXIT_CODE_ERROR;
            return false;
        }
        positional.push_back(argv[i]);
    }

    if (positional.empty()) {
        print_usage(prog_.c_str());
        exit_code_ = EXIT_CODE_ERROR;
        return false;
    }

    command_ = positional[0];
    if (command_ == "exec") {
        if (positional.size() < 2) {
            std::cerr << "exec requires an action name\n";
            exit_code_ = EXIT_CODE_ERROR;
            return false;
        }
        exec_action_ = positional[1];
        exec_args_ = positional.size() > 2 ? positional[2] : "{}";
    } else if (command_ != "list" && command_ != "prompt" && command_ != "audit") {
        std::cerr << "Unknown command: " << command_ << "\n";
        exit_code_ = EXIT_CODE_ERROR;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (!config_explicit_ && access(config_file_.c_str(), F_OK) != 0) {
        LOG_DEBUG("No %s found, using built-in defaults", config_file_.c_str());
        return true;
    }

    try {
        config_ = Config::load_file(config_file_);
        LOG_DEBUG("Loaded config from %s", config_file_.c_str());
    } catch (const ConfigError& e) {
        LOG_ERROR("Failed to load config: %s", e.what());
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(log_level_from_string(config_.get_string("log.level", "info")));

    std::string log_file = config_.get_string("log.file", "");
    if (!log_file.empty() && !Logger::instance().set_file(expand_home(log_file))) {
        LOG_WARN("Cannot open log file %s", log_file.c_str());
    }
}

void Application::setup_audit() {
    std::string db_path = expand_home(config_.get_string("audit.db_path", "~/.toolgate/audit.db"));
    int busy_timeout = static_cast<int>(config_.get_int("audit.busy_timeout_ms", 2000));

    // A store that failed to open still receives records; each write then
    // fails and is logged by the dispatcher.
    if (!audit_store_.open(db_path, busy_timeout)) {
        LOG_ERROR("Audit store unavailable (%s): %s", db_path.c_str(),
                  audit_store_.last_error().c_str());
    } else {
        int64_t retention_days = config_.get_int("audit.retention_days", 90);
        if (retention_days > 0) {
            int64_t cutoff = current_timestamp_ms() - retention_days * 86400LL * 1000LL;
            audit_store_.purge_older_than(cutoff);
        }
    }
    registry_.set_audit_sink(&audit_store_);
}

bool Application::setup_registry() {
    try {
        registry_.configure(config_);
    } catch (const ConfigError& e) {
        LOG_ERROR("Invalid safety configuration: %s", e.what());
        return false;
    }

    keyword_ = KeywordApproval::from_config(config_);

    providers_.push_back(std::unique_ptr<ActionProvider>(new BuiltinActionsProvider()));

    for (size_t i = 0; i < providers_.size(); ++i) {
        ActionProvider* provider = providers_[i].get();
        if (!provider->init(config_)) {
            LOG_ERROR("Provider %s failed to initialize", provider->name());
            return false;
        }
        try {
            provider->register_actions(registry_);
        } catch (const RegistrationError& e) {
            LOG_ERROR("Provider %s: %s", provider->name(), e.what());
            return false;
        }
        LOG_DEBUG("Provider %s registered (%s)", provider->name(), provider->description());
    }

    registry_.freeze();
    return true;
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before any threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!load_config()) {
        exit_code_ = EXIT_CODE_ERROR;
        return false;
    }

    setup_logging();
    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (command_ == "exec" || command_ == "audit") {
        setup_audit();
    }

    if (!setup_registry()) {
        exit_code_ = EXIT_CODE_ERROR;
        return false;
    }
    return true;
}

int Application::run() {
    if (command_ == "list") return cmd_list();
    if (command_ == "prompt") return cmd_prompt();
    if (command_ == "exec") return cmd_exec();
    if (command_ == "audit") return cmd_audit();
    return EXIT_CODE_ERROR;
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");

    for (size_t i = 0; i < providers_.size(); ++i) {
        providers_[i]->shutdown();
    }
    registry_.set_audit_sink(nullptr);
    audit_store_.close();

    curl_global_cleanup();
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_list() {
    std::vector<ActionInfo> list = registry_.get_action_list();
    for (size_t i = 0; i < list.size(); ++i) {
        const ActionSpec* spec = registry_.find_action(list[i].name);
        std::cout << list[i].name << "  [" << tier_to_string(list[i].tier) << "]";
        if (spec && !spec->description.empty()) {
            std::cout << "  " << spec->description;
        }
        std::cout << "\n";
    }
    return EXIT_CODE_OK;
}

int Application::cmd_prompt() {
    std::cout << registry_.build_capability_prompt();
    return EXIT_CODE_OK;
}

int Application::cmd_exec() {
    Json args = Json::parse(exec_args_, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        std::cerr << "Arguments must be a JSON object: " << exec_args_ << "\n";
        return EXIT_CODE_ERROR;
    }

    // Confirmation comes only from --confirm, never from the argument JSON.
    args.erase("confirmed");
    Tier tier = registry_.get_tier(exec_action_);
    int required = tier_requires_confirmations(tier);
    if (required > 0 && exec_confirms_ >= required) {
        args["confirmed"] = true;
    } else if (required > 0 && exec_confirms_ > 0) {
        LOG_WARN("%s needs %d confirmations, got %d", exec_action_.c_str(), required,
                 exec_confirms_);
    }

    bool keyword_approved = false;
    if (!exec_keyword_.empty()) {
        keyword_approved = keyword_.validate(exec_keyword_);
        if (!keyword_approved) {
            if (keyword_.enabled()) {
                LOG_WARN("Approval keyword rejected (hint: %s)", keyword_.hint().c_str());
            } else {
                LOG_WARN("Approval keyword rejected: safety.approval_keyword is not configured");
            }
        }
    }

    ToolResult result = registry_.execute(exec_action_, args, exec_source_, exec_override_,
                                          keyword_approved);

    if (json_output_) {
        std::cout << result.to_json().dump(2, ' ', false, Json::error_handler_t::replace) << "\n";
    } else if (result.is_ok()) {
        std::cout << result.output;
        if (!result.output.empty() && result.output[result.output.size() - 1] != '\n') {
            std::cout << "\n";
        }
    } else {
        std::cerr << (result.is_blocked() ? "Blocked" : "Error") << " ["
                  << tier_to_string(result.tier) << ", " << error_kind_to_string(result.error_kind)
                  << "]: " << result.reason << "\n";
    }

    if (result.is_ok()) return EXIT_CODE_OK;
    return result.is_blocked() ? EXIT_CODE_BLOCKED : EXIT_CODE_ERROR;
}

int Application::cmd_audit() {
    if (!audit_store_.is_open()) {
        std::cerr << "Audit store is not available\n";
        return EXIT_CODE_ERROR;
    }

    std::vector<AuditRecord> records;
    if (audit_since_ >= 0 || audit_until_ >= 0) {
        int64_t from = audit_since_ >= 0 ? audit_since_ : 0;
        int64_t to = audit_until_ >= 0 ? audit_until_ : current_timestamp_ms() + 1;
        records = audit_store_.query_range(from, to, audit_limit_);
    } else {
        records = audit_store_.recent(audit_limit_);
    }

    if (json_output_) {
        Json out = Json::array();
        for (size_t i = 0; i < records.size(); ++i) {
            out.push_back(records[i].to_json());
        }
        std::cout << out.dump(2, ' ', false, Json::error_handler_t::replace) << "\n";
        return EXIT_CODE_OK;
    }

    for (size_t i = 0; i < records.size(); ++i) {
        const AuditRecord& r = records[i];
        std::cout << format_timestamp_ms(r.timestamp_ms) << "  "
                  << source_to_string(r.source) << "  "
                  << r.action << "  [" << tier_to_string(r.tier) << "]  "
                  << outcome_to_string(r.outcome) << "  "
                  << format_duration(r.duration_ms);
        if (r.slow) std::cout << "  SLOW";
        if (!r.reason.empty()) std::cout << "  " << r.reason;
        std::cout << "\n";
    }
    if (records.empty()) {
        std::cout << "(no audit records)\n";
    }
    return EXIT_CODE_OK;
}

} // namespace toolgate
