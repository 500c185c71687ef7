// EN: Worker pool used by the chunk processor to run attempts concurrently.
// FR: Pool de workers utilisé par le processeur de chunks pour exécuter les tentatives en parallèle.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace GCS {

ThreadPool::ThreadPool(const ThreadPoolConfig& config) : config_(config) {
    if (config_.worker_count == 0) {
        throw std::invalid_argument("worker_count must be at least 1");
    }

    for (size_t i = 0; i < config_.worker_count; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(config_.name, std::to_string(workers_.size()) + " workers started");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// EN: Heap comparator: true when lhs must run after rhs.
// FR: Comparateur du tas : vrai quand lhs doit passer après rhs.
bool ThreadPool::runsAfter(const Job& lhs, const Job& rhs) {
    if (lhs.priority != rhs.priority) {
        return lhs.priority < rhs.priority;
    }
    return lhs.ticket > rhs.ticket;
}

void ThreadPool::push(std::function<void()> run, TaskPriority priority, const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            throw std::runtime_error("thread pool '" + config_.name + "' is shut down");
        }
        if (config_.max_queue_size != 0 && heap_.size() >= config_.max_queue_size) {
            throw std::runtime_error("thread pool '" + config_.name + "' queue is full (" +
                                     std::to_string(config_.max_queue_size) + ")");
        }
        heap_.push_back(Job{std::move(run), priority, next_ticket_++, name});
        std::push_heap(heap_.begin(), heap_.end(), &ThreadPool::runsAfter);
        peak_queue_ = std::max(peak_queue_, heap_.size());
    }
    work_ready_.notify_one();
}

void ThreadPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        work_ready_.wait(lock, [this] { return stopping_.load() || !heap_.empty(); });
        if (discard_queue_ || heap_.empty()) {
            return;
        }

        std::pop_heap(heap_.begin(), heap_.end(), &ThreadPool::runsAfter);
        Job job = std::move(heap_.back());
        heap_.pop_back();
        ++busy_;

        lock.unlock();
        bool ok = true;
        try {
            job.run();
        } catch (const std::exception& e) {
            ok = false;
            LOG_ERROR(config_.name, "Task '" + job.name + "' threw: " + e.what());
        }
        lock.lock();

        --busy_;
        ++(ok ? completed_ : failed_);
        if (busy_ == 0 && heap_.empty()) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return busy_ == 0 && (heap_.empty() || discard_queue_); });
}

// EN: Graceful: queued jobs still run before the workers exit.
// FR: Gracieux : les jobs en queue s'exécutent encore avant la sortie des workers.
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_.store(true);
    }
    work_ready_.notify_all();
    joinAll();
}

void ThreadPool::forceShutdown() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = heap_.size();
        heap_.clear();
        discard_queue_ = true;
        stopping_.store(true);
    }
    if (dropped > 0) {
        LOG_WARN(config_.name, "Dropped " + std::to_string(dropped) + " queued tasks");
    }
    work_ready_.notify_all();
    idle_.notify_all();
    joinAll();
}

void ThreadPool::joinAll() {
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ThreadPoolStats stats;
    stats.total_threads = workers_.size();
    stats.active_threads = busy_;
    stats.queued_tasks = heap_.size();
    stats.completed_tasks = completed_;
    stats.failed_tasks = failed_;
    stats.peak_queue_size = peak_queue_;
    return stats;
}

} // namespace GCS
