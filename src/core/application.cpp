/*
 * bashgate C++17 - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <bashgate/core/application.hpp>
#include <bashgate/core/app_info.hpp>
#include <bashgate/core/line_buffer.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

#include <iostream>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <vector>
#include <poll.h>
#include <unistd.h>

namespace bashgate {

namespace {
const int STDIN_POLL_MS = 200;
const size_t MAX_LINE_BYTES = 16 * 1024 * 1024;
}

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - policy-checked shell command gateway\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE  Service configuration (JSON)\n"
              << "  --policy FILE  Policy file (overrides policy_file in the config)\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Requests are read as JSON-RPC lines on stdin, responses written to stdout.\n"
              << "Send SIGHUP to reload the policy file.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handlers
// ============================================================================

namespace {
    void stop_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }

    void reload_handler(int sig) {
        (void)sig;
        Application::instance().request_reload();
    }

    void install_handler(int sig, void (*handler)(int)) {
        struct sigaction sa;
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;  // no SA_RESTART: poll() on stdin must wake up
        sigaction(sig, &sa, NULL);
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , reload_requested_(false)
    , exit_code_(0)
    , thread_pool_(nullptr)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--policy") == 0 && i + 1 < argc) {
            policy_override_ = std::string(argv[++i]);
            continue;
        }
        std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

void Application::setup_signals() {
    install_handler(SIGINT, stop_handler);
    install_handler(SIGTERM, stop_handler);
    install_handler(SIGHUP, reload_handler);

    // A client that hangs up must not kill us mid-write
    signal(SIGPIPE, SIG_IGN);
}

void Application::setup_logging() {
    auto log_level = config_.get_string("log_level", "info");
    Logger::instance().set_level(log_level_from_string(log_level));
}

bool Application::setup_policy() {
    policy_path_ = policy_override_.empty()
        ? config_.get_string("policy_file", "policy.json")
        : policy_override_;
    policy_path_ = absolute_path(policy_path_);

    try {
        store_.initialize(policy_path_);
    } catch (const ConfigError& e) {
        LOG_ERROR("Cannot load policy from %s: %s", policy_path_.c_str(), e.what());
        return false;
    }
    return true;
}

void Application::setup_gateway() {
    ExecutorOptions options;
    options.shell = config_.get_string("executor.shell", options.shell);
    options.kill_grace_ms = static_cast<int>(
        config_.get_int("executor.kill_grace_ms", options.kill_grace_ms));
    options.drain_ms = static_cast<int>(
        config_.get_int("executor.drain_ms", options.drain_ms));

    gateway_.reset(new Gateway(store_, options));
    dispatcher_.reset(new ToolDispatcher(*gateway_));

    LOG_INFO("Executor: shell=%s, kill_grace_ms=%d, drain_ms=%d",
             options.shell.c_str(), options.kill_grace_ms, options.drain_ms);
}

void Application::setup_watcher() {
    if (!config_.get_bool("watch_policy", true)) {
        LOG_INFO("Policy file watching disabled (watch_policy=false)");
        return;
    }

    Gateway* gateway = gateway_.get();
    watcher_.reset(new PolicyWatcher(policy_path_, [gateway](const std::string& path) {
        gateway->reload(path);
    }));
    if (!watcher_->start()) {
        // Keep serving with the loaded policy; SIGHUP still reloads
        watcher_.reset();
    }
}

bool Application::init(int argc, char* argv[]) {
    // Parse command line
    if (!parse_args(argc, argv)) {
        return false;
    }

    setup_signals();

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    // Load configuration
    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
            exit_code_ = 1;
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    setup_logging();

    if (!setup_policy()) {
        exit_code_ = 1;
        return false;
    }

    setup_gateway();
    setup_watcher();

    int64_t workers = config_.get_int("dispatch.workers", 4);
    thread_pool_ = new ThreadPool(static_cast<size_t>(workers > 0 ? workers : 1));

    return true;
}

void Application::check_reload() {
    if (reload_requested_.exchange(false)) {
        LOG_INFO("SIGHUP received, reloading %s", policy_path_.c_str());
        gateway_->reload(policy_path_);
    }
}

void Application::dispatch(const std::string& line) {
    ToolDispatcher* dispatcher = dispatcher_.get();
    bool queued = thread_pool_->submit([this, dispatcher, line] {
        std::string response;
        if (dispatcher->handle_line(line, response)) {
            write_response(response);
        }
    });
    if (!queued) {
        LOG_WARN("Dropping request received during shutdown");
    }
}

void Application::write_response(const std::string& response) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (fwrite(response.data(), 1, response.size(), stdout) != response.size() ||
        fputc('\n', stdout) == EOF || fflush(stdout) != 0) {
        LOG_ERROR("Failed to write response: %s", strerror(errno));
        stop();
    }
}

int Application::run() {
    LOG_INFO("Ready: %zu workers, reading requests on stdin", thread_pool_->size());

    LineBuffer input(MAX_LINE_BYTES);
    std::vector<std::string> lines;
    char buffer[4096];

    while (running_.load()) {
        check_reload();

        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, STDIN_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll() on stdin failed: %s", strerror(errno));
            exit_code_ = 1;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_ERROR("read() on stdin failed: %s", strerror(errno));
            exit_code_ = 1;
            break;
        }
        if (n == 0) {
            LOG_INFO("stdin closed");
            break;
        }

        lines.clear();
        size_t dropped = input.feed(buffer, static_cast<size_t>(n), lines);
        for (size_t i = 0; i < lines.size(); ++i) {
            dispatch(lines[i]);
        }
        for (size_t i = 0; i < dropped; ++i) {
            LOG_WARN("Discarding request line over %zu bytes", MAX_LINE_BYTES);
            write_response(ToolDispatcher::make_error(
                nullptr, rpc::INVALID_REQUEST,
                "Request exceeds " + std::to_string(MAX_LINE_BYTES) + " bytes").dump());
        }
    }

    std::string rest;
    if (input.take_rest(rest)) {
        dispatch(rest);
    }

    return exit_code_;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    if (watcher_) {
        watcher_->stop();
        watcher_.reset();
        LOG_DEBUG("[App] Policy watcher stopped");
    }

    // Stop thread pool (wait for pending)
    if (thread_pool_) {
        LOG_DEBUG("[App] Stopping thread pool (pending: %zu)", thread_pool_->pending());
        thread_pool_->shutdown();
        delete thread_pool_;
        thread_pool_ = nullptr;
        LOG_DEBUG("[App] Thread pool stopped");
    }

    LOG_INFO("Goodbye!");
}

} // namespace bashgate
