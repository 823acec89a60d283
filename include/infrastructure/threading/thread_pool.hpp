#pragma once

#include <atomic>
#include <chrono>
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

namespace MDC {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    double average_task_duration_ms = 0.0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool size and limits.
// FR: Configuration de la taille et des limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads (fixed for the pool lifetime).
    // FR: Nombre de threads workers (fixe pendant la vie du pool).
    size_t thread_count = 4;

    // EN: Maximum number of queued tasks, 0 means unbounded.
    // FR: Nombre maximum de tâches en queue, 0 signifie illimité.
    size_t max_queue_size = 1000;

    // EN: Name used in log lines.
    // FR: Nom utilisé dans les logs.
    std::string name = "pool";
};

namespace detail {
    // EN: Internal task wrapper with priority and metadata.
    // FR: Wrapper interne de tâche avec priorité et métadonnées.
    struct Task {
        std::function<void()> function;
        TaskPriority priority;
        uint64_t sequence;
        std::string name;

        Task(std::function<void()> f, TaskPriority p, uint64_t seq, const std::string& n = "")
            : function(std::move(f)), priority(p), sequence(seq), name(n) {}

        // EN: Higher priority first, then FIFO within one priority.
        // FR: Priorité la plus haute d'abord, puis FIFO à priorité égale.
        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

// EN: Fixed-size thread pool with a priority queue. Exceptions thrown by a task
//     reach the caller through the returned future and are counted as failures.
// FR: Pool de threads de taille fixe avec queue prioritaire. Les exceptions d'une tâche
//     atteignent l'appelant via le future retourné et sont comptées comme échecs.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - runs the queued tasks, then stops all threads.
    // FR: Destructeur - exécute les tâches en queue puis arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // EN: Submit a task with specified priority and return a future.
    // FR: Soumet une tâche avec priorité spécifiée et retourne un future.
    template<typename F, typename... Args>
    auto submit(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task with priority for better debugging.
    // FR: Soumet une tâche nommée avec priorité pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Wait until the queue is empty and no task is running. Must not be called from a worker.
    // FR: Attend que la queue soit vide et qu'aucune tâche ne tourne. Interdit depuis un worker.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully. Idempotent.
    // FR: Arrête le pool de threads de manière gracieuse. Idempotent.
    void shutdown();

    bool isShuttingDown() const { return shutdown_requested_.load(); }

    ThreadPoolStats getStats() const;

    const ThreadPoolConfig& getConfig() const { return config_; }

private:
    void workerLoop();

    void enqueue(std::function<void()> function, TaskPriority priority, const std::string& name);

    void recordDuration(std::chrono::milliseconds duration);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};

    std::chrono::system_clock::time_point start_time_;
    mutable std::mutex stats_mutex_;
    size_t timed_tasks_ = 0;
    double total_duration_ms_ = 0.0;
};

template<typename F, typename... Args>
auto ThreadPool::submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto bound = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [this, bound]() mutable -> return_type {
            try {
                return bound();
            } catch (...) {
                failed_tasks_++;
                throw;
            }
        });

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, name);
    return result;
}

} // namespace MDC
