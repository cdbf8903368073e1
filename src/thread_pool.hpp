#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed-size pool. Each task receives the index of the worker running it,
// so callers can keep per-worker scratch state (renderer buffers) without
// locking.
class ThreadPool {
public:
    using Task = std::function<void(int worker)>;

    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(n_threads);
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this, i] { worker_loop(i); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_task.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int size() const { return static_cast<int>(workers.size()); }

    void submit(Task f)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            ++pending;
            tasks.push_back(std::move(f));
        }
        cv_task.notify_one();
    }

    // Blocks until every submitted task has finished.
    void wait()
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return pending == 0; });
    }

private:
    void worker_loop(int index)
    {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_task.wait(lock, [this] { return !tasks.empty() || stopping; });
                if (stopping && tasks.empty()) return;
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            task(index);
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (--pending == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread> workers;
    std::deque<Task>         tasks;
    std::mutex               mtx;
    std::condition_variable  cv_task;
    std::condition_variable  cv_done;
    int                      pending  = 0;
    bool                     stopping = false;
};
