// src/thread_pool.cpp
#include "thread_pool.hpp"
#include "drive_log.hpp"

namespace ChunkDrive
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool cannot be initialized with 0 threads.");
            }
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back([this]
                                     { workerLoop(); });
            }
            Logging::info("THREAD POOL", "", "Started " + std::to_string(num_threads) + " transfer worker(s).");
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    // Wait until there's a task or the pool is stopping
                    condition.wait(lock, [this]
                                   { return stop_all || !tasks.empty(); });

                    // If stopping and no more tasks, exit the loop
                    if (stop_all && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }
                // Execute the task outside the lock
                task();
            }
        }

        void ThreadPool::shutdown()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                if (stop_all)
                {
                    return;
                }
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

        ThreadPool::~ThreadPool()
        {
            shutdown();
        }

    } // namespace Concurrency
} // namespace ChunkDrive
