/*
 * bashgate C++17 - Application
 *
 * Process lifecycle: command line, service config, logging, initial
 * policy load, watcher, signals, and the stdin request loop. stdout is
 * reserved for protocol responses; everything else goes to the log on
 * stderr.
 */
#ifndef bashgate_CORE_APPLICATION_HPP
#define bashgate_CORE_APPLICATION_HPP

#include "config.hpp"
#include "thread_pool.hpp"
#include "tool_dispatcher.hpp"
#include <bashgate/gate/gateway.hpp>
#include <bashgate/policy/policy_store.hpp>
#include <bashgate/policy/policy_watcher.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace bashgate {

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit right away (--help,
    // --version or a fatal startup error); exit_code() says how.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    // Async-signal-safe
    void stop() { running_.store(false); }
    void request_reload() { reload_requested_.store(true); }

    int exit_code() const { return exit_code_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_signals();
    void setup_logging();
    bool setup_policy();
    void setup_gateway();
    void setup_watcher();

    void check_reload();
    void dispatch(const std::string& line);
    void write_response(const std::string& response);

    std::atomic<bool> running_;
    std::atomic<bool> reload_requested_;
    int exit_code_;

    Config config_;
    std::string config_file_;
    std::string policy_override_;
    std::string policy_path_;

    PolicyStore store_;
    std::unique_ptr<Gateway> gateway_;
    std::unique_ptr<ToolDispatcher> dispatcher_;
    std::unique_ptr<PolicyWatcher> watcher_;
    ThreadPool* thread_pool_;

    std::mutex output_mutex_;
};

} // namespace bashgate

#endif // bashgate_CORE_APPLICATION_HPP
