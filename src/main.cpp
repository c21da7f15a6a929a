/*
 * bashgate C++17 - Policy-checked shell command gateway
 *
 * Runs shell commands on behalf of an automated client, but only those
 * the administrator's policy allows, in the directories it allows.
 *
 * Usage:
 *   ./bashgate [--config bashgate.json] [--policy policy.json]
 */
#include <bashgate/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = bashgate::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
