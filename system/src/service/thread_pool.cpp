// ============= src/service/thread_pool.cpp =============
#include "service/thread_pool.hpp"
#include <spdlog/spdlog.h>

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name(std::move(name)) {
    if (num_threads == 0) num_threads = 1;
    spdlog::debug("🔧 Pool '{}': {} workers", this->name, num_threads);

    workers.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_loop, this, i);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw std::runtime_error("Pool '" + name + "' is stopped");
        }
        jobs.push(std::move(job));
    }
    job_ready.notify_one();
}

void ThreadPool::worker_loop(size_t worker_id) {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            job_ready.wait(lock, [this] { return stopping || !jobs.empty(); });

            // stop() deja terminar lo que ya estaba encolado
            if (jobs.empty()) return;

            job = std::move(jobs.front());
            jobs.pop();
            ++running;
        }

        // packaged_task guarda las excepciones en el future; esto solo
        // atrapa fallos del propio envoltorio
        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Pool '{}' worker {}: {}", name, worker_id, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            --running;
            ++completed;
        }
        idle.notify_all();
    }
}

ThreadPool::Stats ThreadPool::stats() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return Stats{jobs.size(), running, completed};
}

void ThreadPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle.wait(lock, [this] { return jobs.empty() && running == 0; });
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping && workers.empty()) return;
        stopping = true;
    }
    job_ready.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
    workers.clear();
    idle.notify_all();
}
