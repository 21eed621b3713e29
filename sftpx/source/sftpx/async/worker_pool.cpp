#include <sftpx/async/worker_pool.hpp>

#include <algorithm>
#include <thread>

namespace Sftpx::Async
{
    WorkerPool::WorkerPool(std::size_t threadCount)
        : threadCount_{std::max<std::size_t>(threadCount, 1)}
        , pool_{threadCount_}
    {}

    WorkerPool::~WorkerPool()
    {
        pool_.join();
    }

    WorkerPool::executor_type WorkerPool::executor() noexcept
    {
        return pool_.get_executor();
    }

    std::size_t WorkerPool::threadCount() const noexcept
    {
        return threadCount_;
    }

    std::size_t defaultWorkerCount()
    {
        return std::clamp<std::size_t>(std::thread::hardware_concurrency(), 2, 16);
    }

    WorkerPool& defaultWorkerPool()
    {
        static WorkerPool pool{defaultWorkerCount()};
        return pool;
    }
}
