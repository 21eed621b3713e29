#pragma once

#include <sftpx/async/worker_pool.hpp>

#include <future>
#include <type_traits>
#include <utility>

namespace Sftpx::Async
{
    /**
     * @brief Moves a blocking call onto the given pool and returns a future for its result.
     *
     * There is no timeout, a call that never returns keeps its worker busy.
     *
     * @param pool The pool to run on.
     * @param func The blocking callable.
     * @param args Arguments for func, copied (or moved) into the task.
     * @return A future holding the result of func or the exception it threw.
     */
    template <typename FunctionT, typename... Args>
    auto offload(WorkerPool& pool, FunctionT&& func, Args&&... args)
    {
        return pool.offload(std::forward<FunctionT>(func), std::forward<Args>(args)...);
    }

    /**
     * @brief Same as above, using the default pool.
     */
    template <typename FunctionT, typename... Args>
    requires std::is_invocable_v<std::decay_t<FunctionT>, std::decay_t<Args>...>
    auto offload(FunctionT&& func, Args&&... args)
    {
        return defaultWorkerPool().offload(std::forward<FunctionT>(func), std::forward<Args>(args)...);
    }
}
