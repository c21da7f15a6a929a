/*
 * bashgate C++17 - Policy Store Implementation
 */
#include <bashgate/policy/policy_store.hpp>
#include <bashgate/core/logger.hpp>

namespace bashgate {

PolicyStore::PolicyStore()
    : source_(new FilePolicySource())
    , generation_(0)
{}

PolicyStore::PolicyStore(std::unique_ptr<PolicySource> source)
    : source_(std::move(source))
    , generation_(0)
{
    if (!source_) {
        source_.reset(new FilePolicySource());
    }
}

PolicySnapshot PolicyStore::load(const std::string& location) const {
    return PolicySnapshot::parse(source_->read(location));
}

void PolicyStore::initialize(const std::string& location) {
    std::shared_ptr<const PolicySnapshot> snapshot =
        std::make_shared<const PolicySnapshot>(load(location));

    std::lock_guard<std::mutex> lock(writer_mutex_);
    swap_in(snapshot);
    LOG_INFO("Policy loaded from %s (%zu commands, %zu directories, strict=%s, max_output=%zu, sha256=%.12s)",
             location.c_str(), snapshot->allowed_commands().size(),
             snapshot->allowed_directories().size(),
             snapshot->strict_validation() ? "true" : "false",
             snapshot->max_output_size(), snapshot->digest().c_str());
}

void PolicyStore::install(const PolicySnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    swap_in(std::make_shared<const PolicySnapshot>(snapshot));
}

std::shared_ptr<const PolicySnapshot> PolicyStore::get() const {
    return std::atomic_load(&current_);
}

bool PolicyStore::reload(const std::string& location) {
    std::shared_ptr<const PolicySnapshot> candidate;
    try {
        candidate = std::make_shared<const PolicySnapshot>(load(location));
    } catch (const ConfigError& e) {
        LOG_WARN("Policy reload from %s rejected, keeping current policy: %s",
                 location.c_str(), e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_WARN("Policy reload from %s failed, keeping current policy: %s",
                 location.c_str(), e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    std::shared_ptr<const PolicySnapshot> active = std::atomic_load(&current_);
    if (active && !candidate->digest().empty() && active->digest() == candidate->digest()) {
        LOG_DEBUG("Policy at %s unchanged (sha256=%.12s)", location.c_str(),
                  candidate->digest().c_str());
        return true;
    }

    swap_in(candidate);
    LOG_INFO("Policy reloaded from %s (%zu commands, %zu directories, strict=%s, max_output=%zu, sha256=%.12s)",
             location.c_str(), candidate->allowed_commands().size(),
             candidate->allowed_directories().size(),
             candidate->strict_validation() ? "true" : "false",
             candidate->max_output_size(), candidate->digest().c_str());
    return true;
}

// Caller holds writer_mutex_
void PolicyStore::swap_in(std::shared_ptr<const PolicySnapshot> next) {
    std::atomic_store(&current_, next);
    generation_.fetch_add(1);
}

} // namespace bashgate
