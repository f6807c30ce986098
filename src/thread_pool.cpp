// src/thread_pool.cpp
#include "merkle_chunker/thread_pool.hpp"
#include <iostream>

namespace MerkleChunker
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads) : stopping(false)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool: at least one worker is required.");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back(&ThreadPool::workerLoop, this);
            }
            std::clog << "[pool] " << num_threads << " hashing workers ready." << std::endl;
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                stopping = true;
            }
            task_available.notify_all();
            for (auto &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

        void ThreadPool::workerLoop()
        {
            while (true)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    task_available.wait(lock, [this]
                                        { return stopping || !tasks.empty(); });
                    if (tasks.empty())
                    {
                        return; // stopping and drained
                    }
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                // Exceptions land in the task's future.
                task();
            }
        }

    } // namespace Concurrency
} // namespace MerkleChunker
