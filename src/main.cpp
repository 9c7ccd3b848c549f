/*
 * ToolGate C++ - Tool execution safety gateway
 *
 * Usage:
 *   ./toolgate [--config config.json] <list|prompt|exec|audit> [args]
 */
#include <toolgate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = toolgate::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version, bad arguments or fatal errors
        int code = app.exit_code();
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
