#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace agentrelay {

namespace net = boost::asio;

/**
 * IOContextPool - one io_context per thread.
 *
 * Context 0 is the control context: the acceptor, the nonce sweeper and
 * signal handling live there, and run() drives it on the calling thread.
 * Accepted connections are spread over all contexts with next_context() and
 * stay on the one they were given, so a relay session and its upstream leg
 * share a thread and need no locking.
 */
class IOContextPool {
public:
    // 0 = one context per hardware thread
    explicit IOContextPool(size_t threads = 0);

    ~IOContextPool();

    IOContextPool(const IOContextPool&) = delete;
    IOContextPool& operator=(const IOContextPool&) = delete;

    net::io_context& control_context() { return *contexts_.front(); }

    // Round-robin placement for a new connection
    net::io_context& next_context();

    size_t size() const { return contexts_.size(); }

    // Starts contexts 1..n-1 on worker threads, then runs the control context
    // here. Returns after stop() once every worker has exited.
    void run();

    // Callable from a handler on the pool or from another thread
    void stop();

private:
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    void join_workers();

    std::vector<std::unique_ptr<net::io_context>> contexts_;
    std::vector<WorkGuard> guards_;
    std::vector<std::thread> workers_;
    std::atomic<size_t> next_{0};
};

} // namespace agentrelay
