#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <exception>
#include <iostream>

namespace reclaim::engine {

    /**
     * @brief Fixed-size pool of OS threads draining a FIFO of tasks.
     *
     * Tasks may submit further tasks (a directory task queues its
     * subdirectories). wait() returns once the queue is empty and no task is
     * running, which covers tasks spawned while waiting.
     */
    class WorkerPool {
    public:
        using Task = std::function<void()>;

        explicit WorkerPool(unsigned threads = 0) {
            if (threads == 0) threads = std::thread::hardware_concurrency();
            if (threads == 0) threads = 1;
            m_threads.reserve(threads);
            try {
                for (unsigned i = 0; i < threads; ++i) {
                    m_threads.emplace_back([this] { run(); });
                }
            } catch (...) {
                shutdown();
                throw;
            }
        }

        ~WorkerPool() {
            shutdown();
        }

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        void submit(Task task) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(task));
            }
            m_cv.notify_one();
        }

        void wait() {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_idle_cv.wait(lock, [this] { return m_queue.empty() && m_active == 0; });
        }

        size_t size() const { return m_threads.size(); }

    private:
        std::queue<Task> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::condition_variable m_idle_cv;
        size_t m_active = 0;
        bool m_stop = false;
        std::vector<std::thread> m_threads;

        void run() {
            while (true) {
                Task task;
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });
                    if (m_stop && m_queue.empty()) return;

                    task = std::move(m_queue.front());
                    m_queue.pop();
                    ++m_active;
                }

                try {
                    task();
                } catch (const std::exception& e) {
                    std::cerr << "[WorkerPool] Task failed: " << e.what() << "\n";
                } catch (...) {
                    // Logged and counted as finished so wait() still returns.
                    std::cerr << "[WorkerPool] Task failed with unknown exception\n";
                }

                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    --m_active;
                    if (m_queue.empty() && m_active == 0) m_idle_cv.notify_all();
                }
            }
        }

        void shutdown() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
            for (auto& t : m_threads) {
                if (t.joinable()) t.join();
            }
            m_threads.clear();
        }
    };

}
