#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Sftpx::Async
{
    /**
     * @brief A fixed number of worker threads that blocking calls are moved onto.
     * Joins all workers on destruction, pending work is still executed.
     */
    class WorkerPool
    {
      public:
        using executor_type = boost::asio::thread_pool::executor_type;

        explicit WorkerPool(std::size_t threadCount);
        ~WorkerPool();
        WorkerPool(WorkerPool const&) = delete;
        WorkerPool& operator=(WorkerPool const&) = delete;
        WorkerPool(WorkerPool&&) = delete;
        WorkerPool& operator=(WorkerPool&&) = delete;

        executor_type executor() noexcept;
        std::size_t threadCount() const noexcept;

        /**
         * @brief Runs func(args...) on one of the workers.
         *
         * The arguments are decay-copied into the task. The return value and any exception thrown are delivered
         * through the future unchanged.
         */
        template <typename FunctionT, typename... Args>
        auto offload(FunctionT&& func, Args&&... args)
            -> std::future<std::invoke_result_t<std::decay_t<FunctionT>, std::decay_t<Args>...>>
        {
            using ResultType = std::invoke_result_t<std::decay_t<FunctionT>, std::decay_t<Args>...>;

            auto task = std::make_shared<std::packaged_task<ResultType()>>(
                [func = std::forward<FunctionT>(func), ... args = std::forward<Args>(args)]() mutable -> ResultType {
                    return std::invoke(std::move(func), std::move(args)...);
                });
            auto future = task->get_future();
            boost::asio::post(pool_, [task = std::move(task)]() {
                (*task)();
            });
            return future;
        }

      private:
        std::size_t threadCount_;
        boost::asio::thread_pool pool_;
    };

    /**
     * @brief The process wide pool shared by all sessions that do not bring their own.
     * Sized to the hardware concurrency, but at least 2 and at most 16 threads.
     */
    WorkerPool& defaultWorkerPool();

    std::size_t defaultWorkerCount();
}
