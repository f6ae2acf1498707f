#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Owns the io_context and worker pool that discovery work runs on.
 *
 * Subnet sweeps fan identifications out through submit(); the session
 * reaper schedules its timer on getContext(). An executor_work_guard keeps
 * the workers alive between jobs until stop().
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @param threadCount Number of worker threads; zero is treated as one.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     *
     * Handlers still queued are not run until the next start().
     */
    void stop();

    asio::io_context& getContext() { return ioContext_; }

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a callable on the pool and returns its result as a future.
     *
     * Exceptions thrown by the callable are stored in the future.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace netsweep::infra
