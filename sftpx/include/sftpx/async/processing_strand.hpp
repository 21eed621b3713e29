#pragma once

#include <sftpx/async/worker_pool.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace Sftpx::Async
{
    /**
     * @brief Serial executor on a shared worker pool.
     *
     * Tasks pushed to one strand run in push order and never overlap; different strands on the same pool run in
     * parallel. After the final task was pushed the strand accepts nothing more, the tasks already queued still run.
     */
    class ProcessingStrand
    {
      public:
        using StrandType = boost::asio::strand<WorkerPool::executor_type>;

        /**
         * @param pool Executes the tasks, must outlive the strand.
         */
        explicit ProcessingStrand(WorkerPool& pool)
            : strand_{boost::asio::make_strand(pool.executor())}
        {}
        ProcessingStrand(ProcessingStrand const&) = delete;
        ProcessingStrand& operator=(ProcessingStrand const&) = delete;

        /**
         * @brief The future holds the result of func, or std::runtime_error when the strand is finalized.
         */
        template <typename Func>
        auto pushPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            return push(std::forward<Func>(func), false);
        }

        /**
         * @brief Like pushPromiseTask, and finalizes the strand.
         */
        template <typename Func>
        auto pushFinalPromiseTask(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            return push(std::forward<Func>(func), true);
        }

        bool isFinalized() const noexcept
        {
            std::scoped_lock lock(mutex_);
            return finalized_;
        }

      private:
        template <typename Func>
        auto push(Func&& func, bool finalize) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
        {
            using ResultType = std::invoke_result_t<std::decay_t<Func>>;

            std::scoped_lock lock(mutex_);
            if (finalized_)
            {
                std::promise<ResultType> rejected{};
                rejected.set_exception(
                    std::make_exception_ptr(std::runtime_error("Cannot push task to finalized strand.")));
                return rejected.get_future();
            }
            finalized_ = finalize;

            auto task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<Func>(func));
            auto future = task->get_future();
            boost::asio::post(strand_, [task = std::move(task)]() {
                (*task)();
            });
            return future;
        }

      private:
        mutable std::mutex mutex_{};
        bool finalized_ = false;
        StrandType strand_;
    };
}
