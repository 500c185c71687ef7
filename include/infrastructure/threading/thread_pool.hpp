#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace GCS {

// EN: Retries are queued HIGH so a failed chunk does not wait behind fresh ones.
// FR: Les reprises sont en HIGH pour qu'un chunk en échec n'attende pas derrière les nouveaux.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
};

struct ThreadPoolConfig {
    size_t worker_count = 1;
    size_t max_queue_size = 0;      // EN: 0 = unbounded / FR: 0 = illimité
    std::string name = "threadpool";
};

// EN: Fixed set of workers draining a priority heap. Equal priorities run in submission order.
// FR: Ensemble fixe de workers vidant un tas de priorités. À priorité égale, ordre de soumission.
class ThreadPool {
public:
    template<typename F, typename... Args>
    using ResultOf = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    std::future<ResultOf<F, Args...>> submit(F&& f, Args&&... args) {
        return submitNamed("", TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
    }

    template<typename F, typename... Args>
    std::future<ResultOf<F, Args...>> submit(TaskPriority priority, F&& f, Args&&... args) {
        return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
    }

    // EN: Throws std::runtime_error once shut down or when the bounded queue is full.
    //     Exceptions thrown by the task reach the returned future.
    // FR: Lance std::runtime_error après l'arrêt ou quand la queue bornée est pleine.
    //     Les exceptions de la tâche remontent dans le future retourné.
    template<typename F, typename... Args>
    std::future<ResultOf<F, Args...>> submitNamed(const std::string& name, TaskPriority priority,
                                                  F&& f, Args&&... args) {
        using R = ResultOf<F, Args...>;
        auto job = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
                return std::apply(fn, std::move(bound));
            });
        std::future<R> future = job->get_future();
        push([job]() { (*job)(); }, priority, name);
        return future;
    }

    // EN: Blocks until the heap is empty and no worker is busy.
    // FR: Bloque jusqu'à ce que le tas soit vide et qu'aucun worker ne travaille.
    void waitForAll();
    void shutdown();
    void forceShutdown();

    bool isShutdown() const { return stopping_.load(); }
    ThreadPoolStats getStats() const;

private:
    struct Job {
        std::function<void()> run;
        TaskPriority priority;
        uint64_t ticket;
        std::string name;
    };

    static bool runsAfter(const Job& lhs, const Job& rhs);

    void push(std::function<void()> run, TaskPriority priority, const std::string& name);
    void workerLoop();
    void joinAll();

    ThreadPoolConfig config_;
    std::vector<std::thread> workers_;
    std::vector<Job> heap_;

    mutable std::mutex mutex_;
    std::condition_variable work_ready_;
    std::condition_variable idle_;
    uint64_t next_ticket_ = 0;
    size_t busy_ = 0;
    size_t peak_queue_ = 0;
    size_t completed_ = 0;
    size_t failed_ = 0;

    std::atomic<bool> stopping_{false};
    bool discard_queue_ = false;
};

} // namespace GCS
