#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace CEED {

/**
 * @brief Fixed-size pool running ensemble members owned by one rank
 *
 * Tasks must not throw; wrap member work and record failures in the
 * member's own result slot. waitAll() blocks until every enqueued task has
 * finished.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = std::thread::hardware_concurrency()) {
        num_threads = std::max<size_t>(1, num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex);
                        condition.wait(lock, [this] {
                            return stop || !tasks.empty();
                        });
                        if (stop && tasks.empty()) return;
                        task = std::move(tasks.front());
                        tasks.pop();
                    }
                    task();
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex);
                        --pending;
                    }
                    done.notify_all();
                }
            });
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for (auto& worker : workers) {
            worker.join();
        }
    }

    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            tasks.emplace(std::forward<F>(f));
            ++pending;
        }
        condition.notify_one();
    }

    void waitAll() {
        std::unique_lock<std::mutex> lock(queue_mutex);
        done.wait(lock, [this] { return pending == 0; });
    }

    size_t numThreads() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable done;
    size_t pending = 0;
    bool stop = false;
};

} // namespace CEED

#endif // WORKER_POOL_HPP
