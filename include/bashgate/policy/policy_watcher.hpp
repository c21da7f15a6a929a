/*
 * bashgate C++17 - Policy File Watcher
 *
 * Watches the directory that holds the policy file, not the file itself,
 * so editors that save by writing a temp file and renaming it over the
 * old file are still seen. Any close-after-write, create or rename-into
 * event for the file's name fires the callback with the file path.
 */
#ifndef bashgate_POLICY_POLICY_WATCHER_HPP
#define bashgate_POLICY_POLICY_WATCHER_HPP

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace bashgate {

class PolicyWatcher {
public:
    typedef std::function<void(const std::string&)> ChangeCallback;

    PolicyWatcher(const std::string& path, ChangeCallback callback);
    ~PolicyWatcher();

    // Set up inotify and start the watch thread. Returns false (and logs)
    // if the watch cannot be created.
    bool start();

    // Stop and join the watch thread. Safe to call more than once.
    void stop();

    bool running() const { return running_.load(); }
    const std::string& path() const { return path_; }

private:
    PolicyWatcher(const PolicyWatcher&);
    PolicyWatcher& operator=(const PolicyWatcher&);

    void watch_loop();

    std::string path_;
    std::string directory_;
    std::string filename_;
    ChangeCallback callback_;

    int inotify_fd_;
    int watch_fd_;
    std::atomic<bool> running_;
    std::thread thread_;
};

} // namespace bashgate

#endif // bashgate_POLICY_POLICY_WATCHER_HPP
