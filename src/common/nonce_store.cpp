#include "common/nonce_store.hpp"
#include "common/crypto.hpp"
#include "common/log.hpp"

namespace agentrelay {

NonceStore::NonceStore(std::chrono::seconds ttl, TimeSource now)
    : ttl_(ttl)
    , now_(std::move(now))
{}

NonceStore::Clock::time_point NonceStore::now() const {
    return now_ ? now_() : Clock::now();
}

std::string NonceStore::issue() {
    std::string value = crypto::random_hex(kNonceBytes);
    auto expires_at = now() + ttl_;

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[value] = expires_at;
    return value;
}

bool NonceStore::consume(const std::string& value) {
    auto current = now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(value);
    if (it == entries_.end()) {
        return false;
    }

    bool valid = it->second > current;
    entries_.erase(it);
    return valid;
}

size_t NonceStore::sweep_expired() {
    auto current = now();

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second <= current) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        NLOG_DEBUG(log::AUTH_LOGGER, "NonceStore: Swept {} expired nonces ({} live)",
                   removed, entries_.size());
    }
    return removed;
}

size_t NonceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace agentrelay
