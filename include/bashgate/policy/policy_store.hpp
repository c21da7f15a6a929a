/*
 * bashgate C++17 - Policy Store
 *
 * Holds the active PolicySnapshot behind a shared_ptr that is swapped
 * atomically. Readers (every request) call get() and keep the returned
 * pointer for the whole validation; a concurrent reload installs a new
 * snapshot without touching the one they hold.
 *
 * Only the reload path writes. Writers are serialized among themselves
 * (watcher thread, SIGHUP, manual reload) by a mutex that readers never
 * take.
 */
#ifndef bashgate_POLICY_POLICY_STORE_HPP
#define bashgate_POLICY_POLICY_STORE_HPP

#include "policy.hpp"
#include "policy_source.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <cstdint>

namespace bashgate {

class PolicyStore {
public:
    // Reads policy files from disk
    PolicyStore();
    explicit PolicyStore(std::unique_ptr<PolicySource> source);

    // Read and parse the policy at `location`. Throws ConfigError.
    PolicySnapshot load(const std::string& location) const;

    // Startup load: load() and install. A ConfigError propagates and is
    // meant to be fatal.
    void initialize(const std::string& location);

    // Install an already-built snapshot (embedding, tests)
    void install(const PolicySnapshot& snapshot);

    // Current snapshot; null only before the first install. Never blocks
    // on a reload in progress.
    std::shared_ptr<const PolicySnapshot> get() const;

    // Re-read `location` and swap it in. On any error the current snapshot
    // stays active, a warning is logged and false is returned.
    bool reload(const std::string& location);

    // Number of snapshots installed so far
    uint64_t generation() const { return generation_.load(); }

private:
    PolicyStore(const PolicyStore&);
    PolicyStore& operator=(const PolicyStore&);

    void swap_in(std::shared_ptr<const PolicySnapshot> next);

    std::unique_ptr<PolicySource> source_;
    std::shared_ptr<const PolicySnapshot> current_;  // accessed via std::atomic_load/store only
    std::mutex writer_mutex_;
    std::atomic<uint64_t> generation_;
};

} // namespace bashgate

#endif // bashgate_POLICY_POLICY_STORE_HPP
