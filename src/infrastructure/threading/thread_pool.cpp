// EN: Implementation of the ThreadPool class. Fixed worker set draining a priority queue.
// FR: Implémentation de la classe ThreadPool. Ensemble fixe de workers vidant une queue prioritaire.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace MDC {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    if (config_.thread_count == 0) {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    workers_.reserve(config_.thread_count);
    for (size_t i = 0; i < config_.thread_count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG("threadpool", "Thread pool '" + config_.name + "' started with " +
              std::to_string(config_.thread_count) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> function, TaskPriority priority, const std::string& name) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.emplace(std::move(function), priority, next_sequence_++, name);

        // EN: Update peak queue size.
        // FR: Met à jour la taille maximale de la queue.
        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }

    queue_condition_.notify_one();
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

// EN: Queued tasks still run; new submissions are rejected.
// FR: Les tâches en queue s'exécutent encore ; les nouvelles soumissions sont refusées.
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }

    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG("threadpool", "Thread pool '" + config_.name + "' stopped after " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats current_stats;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        current_stats.queued_tasks = task_queue_.size();
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        current_stats.average_task_duration_ms =
            timed_tasks_ > 0 ? total_duration_ms_ / static_cast<double>(timed_tasks_) : 0.0;
    }

    current_stats.total_threads = config_.thread_count;
    current_stats.active_threads = active_threads_.load();
    current_stats.idle_threads = current_stats.total_threads - current_stats.active_threads;
    current_stats.completed_tasks = completed_tasks_.load();
    current_stats.failed_tasks = failed_tasks_.load();
    current_stats.peak_queue_size = peak_queue_size_.load();
    current_stats.created_at = start_time_;
    current_stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - start_time_);

    return current_stats;
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> function;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            function = std::move(const_cast<detail::Task&>(task_queue_.top()).function);
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();

        // EN: Packaged tasks store their own exception; this guards raw callables.
        // FR: Les packaged tasks stockent leur exception ; ceci protège les appelables bruts.
        try {
            function();
        } catch (const std::exception& e) {
            failed_tasks_++;
            LOG_ERROR("threadpool", "Task execution failed: " + std::string(e.what()));
        }

        recordDuration(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start));
        completed_tasks_++;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

void ThreadPool::recordDuration(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    timed_tasks_++;
    total_duration_ms_ += static_cast<double>(duration.count());
}

} // namespace MDC
