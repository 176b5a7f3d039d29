#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace agentrelay {

/**
 * NonceStore - Single-use page nonces
 *
 * Each nonce is embedded in one served bootstrap page and may be exchanged
 * for a session token at most once. A consumption attempt removes the entry
 * whether or not it succeeds; an expired, consumed and unknown nonce are
 * indistinguishable to callers.
 *
 * Thread-safe: issue/consume/sweep share one mutex, so concurrent consume()
 * calls on the same value have exactly one winner.
 */
class NonceStore {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTtl{300};
    static constexpr size_t kNonceBytes = 32;

    explicit NonceStore(std::chrono::seconds ttl = kDefaultTtl, TimeSource now = {});

    NonceStore(const NonceStore&) = delete;
    NonceStore& operator=(const NonceStore&) = delete;

    // Generate and record a fresh nonce (hex encoded)
    std::string issue();

    // True exactly once per issued, unexpired nonce
    bool consume(const std::string& value);

    // Drop expired entries, returns how many were removed
    size_t sweep_expired();

    size_t size() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    Clock::time_point now() const;

    std::chrono::seconds ttl_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> entries_;  // value -> expires_at
};

} // namespace agentrelay
