// include/merkle_chunker/thread_pool.hpp
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>     // For std::future, std::packaged_task
#include <functional> // For std::function
#include <memory>     // For std::make_shared
#include <stdexcept>  // For std::runtime_error

namespace MerkleChunker
{
    namespace Concurrency
    {

        // Fixed-size worker pool for the tree builder's fork-join hashing.
        // Tasks must not block on other tasks of the same pool.
        class ThreadPool
        {
        public:
            explicit ThreadPool(size_t num_threads);

            // Runs every queued task before joining the workers.
            ~ThreadPool();

            ThreadPool(const ThreadPool &) = delete;
            ThreadPool &operator=(const ThreadPool &) = delete;

            // Exceptions thrown by the task are rethrown from future::get().
            template <class F, class... Args>
            auto enqueue(F &&f, Args &&...args)
                -> std::future<typename std::result_of<F(Args...)>::type>;

            // Run fn(0) .. fn(count - 1) on the workers and collect the results in
            // index order. Returns only after every task has finished; if any task
            // threw, the exception of the lowest failing index is rethrown.
            template <class F>
            auto mapAll(size_t count, F fn)
                -> std::vector<typename std::result_of<F(size_t)>::type>;

            size_t size() const { return workers.size(); }

        private:
            void workerLoop();

            std::vector<std::thread> workers;
            std::queue<std::function<void()>> tasks;

            std::mutex queue_mutex;
            std::condition_variable task_available;
            bool stopping;
        };

        template <class F, class... Args>
        auto ThreadPool::enqueue(F &&f, Args &&...args)
            -> std::future<typename std::result_of<F(Args...)>::type>
        {
            using return_type = typename std::result_of<F(Args...)>::type;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...));
            std::future<return_type> result = task->get_future();

            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (stopping)
                {
                    throw std::runtime_error("ThreadPool: enqueue after shutdown.");
                }
                tasks.emplace([task]()
                              { (*task)(); });
            }
            task_available.notify_one();
            return result;
        }

        template <class F>
        auto ThreadPool::mapAll(size_t count, F fn)
            -> std::vector<typename std::result_of<F(size_t)>::type>
        {
            using result_type = typename std::result_of<F(size_t)>::type;

            std::vector<std::future<result_type>> pending;
            pending.reserve(count);
            for (size_t i = 0; i < count; ++i)
            {
                pending.push_back(enqueue(fn, i));
            }

            // Tasks may reference the caller's state: join all of them first.
            for (auto &fut : pending)
            {
                fut.wait();
            }

            std::vector<result_type> results;
            results.reserve(count);
            for (auto &fut : pending)
            {
                results.push_back(fut.get());
            }
            return results;
        }

    } // namespace Concurrency
} // namespace MerkleChunker
