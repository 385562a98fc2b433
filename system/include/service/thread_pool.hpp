// ============= include/service/thread_pool.hpp =============
/*
 * Thread Pool de pipelines de album
 *
 * - Cola FIFO, N workers fijos, nombre para los logs ("sync")
 * - submit() devuelve un future (las excepciones viajan en el future)
 * - wait_idle() espera cola vacia y ningun pipeline en curso
 * - stop() termina lo encolado y une los workers; submit() posterior lanza
 */

#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "sync");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& job) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    struct Stats {
        size_t queued = 0;
        size_t running = 0;
        size_t completed = 0;
    };
    Stats stats() const;

    size_t size() const { return workers.size(); }
    const std::string& get_name() const { return name; }

    void wait_idle();
    void stop();

private:
    std::string name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> jobs;

    mutable std::mutex queue_mutex;
    std::condition_variable job_ready;
    std::condition_variable idle;
    bool stopping = false;
    size_t running = 0;
    size_t completed = 0;

    void enqueue(std::function<void()> job);
    void worker_loop(size_t worker_id);
};

// ==================== IMPLEMENTATION ====================

template<typename F>
auto ThreadPool::submit(F&& job) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
    std::future<R> result = task->get_future();

    enqueue([task]() { (*task)(); });
    return result;
}
