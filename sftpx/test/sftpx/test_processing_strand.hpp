#pragma once

#include <sftpx/async/processing_strand.hpp>
#include <sftpx/async/worker_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Sftpx::Test
{
    class ProcessingStrandTests : public ::testing::Test
    {
      protected:
        Async::WorkerPool pool_{4};
    };

    TEST_F(ProcessingStrandTests, TasksRunInPushOrderAndNeverOverlap)
    {
        Async::ProcessingStrand strand{pool_};
        std::vector<int> order{};
        std::atomic_int running{0};
        std::atomic_bool overlapped{false};

        std::vector<std::future<void>> futures{};
        for (int i = 0; i != 50; ++i)
        {
            futures.push_back(strand.pushPromiseTask([&, i]() {
                if (++running > 1)
                    overlapped = true;
                order.push_back(i);
                std::this_thread::sleep_for(100us);
                --running;
            }));
        }
        for (auto& future : futures)
            future.get();

        EXPECT_FALSE(overlapped);
        ASSERT_EQ(order.size(), 50);
        for (int i = 0; i != 50; ++i)
            EXPECT_EQ(order[i], i);
    }

    TEST_F(ProcessingStrandTests, PromiseTaskDeliversResult)
    {
        Async::ProcessingStrand strand{pool_};
        EXPECT_EQ(
            strand
                .pushPromiseTask([]() {
                    return 5;
                })
                .get(),
            5);
    }

    TEST_F(ProcessingStrandTests, FinalTaskRunsAfterEarlierTasks)
    {
        Async::ProcessingStrand strand{pool_};
        std::vector<std::string> order{};
        auto first = strand.pushPromiseTask([&order]() {
            std::this_thread::sleep_for(10ms);
            order.push_back("first");
        });
        auto last = strand.pushFinalPromiseTask([&order]() {
            order.push_back("final");
        });
        first.get();
        last.get();
        EXPECT_EQ(order, (std::vector<std::string>{"first", "final"}));
    }

    TEST_F(ProcessingStrandTests, NothingCanBePushedAfterFinalization)
    {
        Async::ProcessingStrand strand{pool_};
        strand.pushFinalPromiseTask([]() {}).get();
        EXPECT_TRUE(strand.isFinalized());

        auto rejected = strand.pushPromiseTask([]() {
            return 1;
        });
        EXPECT_THROW(rejected.get(), std::runtime_error);

        auto secondFinal = strand.pushFinalPromiseTask([]() {});
        EXPECT_THROW(secondFinal.get(), std::runtime_error);
    }

    TEST_F(ProcessingStrandTests, DifferentStrandsRunInParallel)
    {
        Async::ProcessingStrand first{pool_};
        Async::ProcessingStrand second{pool_};
        auto sleeper = []() {
            std::this_thread::sleep_for(100ms);
        };

        const auto start = std::chrono::steady_clock::now();
        auto a = first.pushPromiseTask(sleeper);
        auto b = second.pushPromiseTask(sleeper);
        a.get();
        b.get();
        EXPECT_LT(std::chrono::steady_clock::now() - start, 180ms);
    }
}
