#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// Fixed set of workers running one batch at a time. parallel_for() hands out
// job indices through an atomic counter; the calling thread helps drain the
// batch and returns once every index has been processed.
// ---------------------------------------------------------------------------
class ThreadPool {
public:
    explicit ThreadPool(int n_threads)
    {
        if (n_threads < 1) n_threads = 1;
        workers.reserve(n_threads);
        for (int i = 0; i < n_threads; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv_start.notify_all();
        for (auto& t : workers) t.join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    int size() const { return static_cast<int>(workers.size()); }

    void parallel_for(int count, const std::function<void(int)>& fn)
    {
        if (count <= 0) return;
        {
            std::lock_guard<std::mutex> lock(mtx);
            job       = &fn;
            job_count = count;
            next.store(0);
            busy      = static_cast<int>(workers.size());
            ++generation;
        }
        cv_start.notify_all();

        drain(fn, count);

        std::unique_lock<std::mutex> lock(mtx);
        cv_done.wait(lock, [this] { return busy == 0; });
        job = nullptr;
    }

private:
    void drain(const std::function<void(int)>& fn, int count)
    {
        for (int i = next.fetch_add(1); i < count; i = next.fetch_add(1))
            fn(i);
    }

    void worker_loop()
    {
        unsigned seen = 0;
        while (true) {
            const std::function<void(int)>* fn;
            int count;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv_start.wait(lock, [&] { return stopping || generation != seen; });
                if (stopping) return;
                seen  = generation;
                fn    = job;
                count = job_count;
            }
            drain(*fn, count);
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (--busy == 0) cv_done.notify_all();
            }
        }
    }

    std::vector<std::thread>          workers;
    std::mutex                        mtx;
    std::condition_variable           cv_start;
    std::condition_variable           cv_done;
    const std::function<void(int)>*   job       = nullptr;
    int                               job_count = 0;
    std::atomic<int>                  next{0};
    int                               busy       = 0;
    unsigned                          generation = 0;
    bool                              stopping   = false;
};
