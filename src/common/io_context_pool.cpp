#include "common/io_context_pool.hpp"
#include "common/log.hpp"
#include <algorithm>
#include <functional>

namespace agentrelay {

namespace {

void drive(net::io_context& ioc, size_t index) {
    try {
        ioc.run();
    } catch (const std::exception& e) {
        LOG_ERROR("IO thread {} stopped by exception: {}", index, e.what());
    }
}

} // anonymous namespace

IOContextPool::IOContextPool(size_t threads) {
    if (threads == 0) {
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    contexts_.reserve(threads);
    guards_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        // Each context is only ever run by one thread
        contexts_.push_back(std::make_unique<net::io_context>(1));
        guards_.push_back(net::make_work_guard(*contexts_.back()));
    }
}

IOContextPool::~IOContextPool() {
    stop();
    join_workers();
}

net::io_context& IOContextPool::next_context() {
    return *contexts_[next_.fetch_add(1, std::memory_order_relaxed) % contexts_.size()];
}

void IOContextPool::run() {
    for (size_t i = 1; i < contexts_.size(); ++i) {
        workers_.emplace_back(drive, std::ref(*contexts_[i]), i);
    }
    LOG_DEBUG("IO pool running: control context plus {} worker threads", workers_.size());

    drive(control_context(), 0);
    join_workers();
}

void IOContextPool::stop() {
    for (auto& guard : guards_) {
        guard.reset();
    }
    for (auto& ioc : contexts_) {
        ioc->stop();
    }
}

void IOContextPool::join_workers() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace agentrelay
