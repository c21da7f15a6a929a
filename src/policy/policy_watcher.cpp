#include <bashgate/policy/policy_watcher.hpp>
#include <bashgate/core/logger.hpp>
#include <bashgate/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <exception>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace bashgate {

namespace {
const int WATCH_POLL_MS = 250;
const uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE;
}

PolicyWatcher::PolicyWatcher(const std::string& path, ChangeCallback callback)
    : path_(absolute_path(path))
    , callback_(callback)
    , inotify_fd_(-1)
    , watch_fd_(-1)
    , running_(false)
{
    size_t slash = path_.rfind('/');
    directory_ = (slash == 0) ? "/" : path_.substr(0, slash);
    filename_ = path_.substr(slash + 1);
}

PolicyWatcher::~PolicyWatcher() {
    stop();
}

bool PolicyWatcher::start() {
    if (running_.load()) return true;
    stop();  // Collect a watch thread that ended on an error

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        LOG_WARN("Policy hot reload disabled: inotify_init1 failed: %s", strerror(errno));
        return false;
    }

    watch_fd_ = inotify_add_watch(inotify_fd_, directory_.c_str(), WATCH_MASK);
    if (watch_fd_ < 0) {
        LOG_WARN("Policy hot reload disabled: cannot watch %s: %s", directory_.c_str(), strerror(errno));
        close(inotify_fd_);
        inotify_fd_ = -1;
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this] { watch_loop(); });
    LOG_INFO("Watching %s for policy changes", path_.c_str());
    return true;
}

void PolicyWatcher::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (inotify_fd_ >= 0) {
        if (watch_fd_ >= 0) {
            inotify_rm_watch(inotify_fd_, watch_fd_);
            watch_fd_ = -1;
        }
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

void PolicyWatcher::watch_loop() {
    char buffer[4096] __attribute__((aligned(__alignof__(struct inotify_event))));

    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, WATCH_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Policy watcher poll failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;

        bool changed = false;
        while (true) {
            ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
            if (len < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_ERROR("Policy watcher read failed: %s", strerror(errno));
                }
                break;
            }
            if (len == 0) break;

            for (char* ptr = buffer; ptr < buffer + len; ) {
                const struct inotify_event* event = reinterpret_cast<const struct inotify_event*>(ptr);
                if (event->len > 0 && filename_ == event->name) {
                    changed = true;
                }
                ptr += sizeof(struct inotify_event) + event->len;
            }
        }

        // One callback per burst of events (an editor save is often several)
        if (changed && running_.load()) {
            LOG_DEBUG("Policy file %s changed", path_.c_str());
            try {
                callback_(path_);
            } catch (const std::exception& e) {
                LOG_ERROR("Policy reload callback failed: %s", e.what());
            }
        }
    }

    running_.store(false);
}

} // namespace bashgate
