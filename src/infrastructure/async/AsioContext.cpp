#include "infrastructure/async/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace netsweep::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::debug("[Async] Started {} worker threads", threadCount_);
}

void AsioContext::runWorker(size_t index) {
    // A throwing handler unwinds out of run(); the worker logs it and rejoins
    // the pool so one bad handler cannot shrink it.
    while (running_.load()) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("[Async] Worker {} handler failed: {}", index, e.what());
        }
    }
    spdlog::debug("[Async] Worker {} exited", index);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Leave the context runnable for the next start()
    ioContext_.restart();
    spdlog::debug("[Async] Stopped");
}

} // namespace netsweep::infra
