#include "SearchWorkerPool.hpp"
#include "ComboErrors.hpp"
#include <iostream>

SearchWorkerPool::SearchWorkerPool(
    size_t num_threads,
    std::shared_ptr<const ComboSearchEngine> engine
) : engine_(std::move(engine)) {

    if (!engine_) {
        throw InvalidParameterError("search pool needs an engine");
    }
    if (num_threads == 0) num_threads = 1;

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&SearchWorkerPool::worker_thread, this);
    }

    stats_.workers = num_threads;

    std::cout << "[Pool] Started with " << num_threads << " workers\n";
}

SearchWorkerPool::~SearchWorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<SearchOutcome> SearchWorkerPool::submit(
    std::vector<std::string> target,
    SearchParams params,
    std::shared_ptr<CancellationToken> cancel
) {
    if (!cancel) cancel = std::make_shared<CancellationToken>();

    Task task;
    task.target = std::move(target);
    task.params = params;
    task.cancel = std::move(cancel);
    task.params.cancel = task.cancel.get();

    auto future = task.result.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_) {
            throw std::runtime_error("search pool is shutting down");
        }
        task_queue_.push(std::move(task));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.queue_size = task_queue_.size();
    }

    queue_cv_.notify_one();

    return future;
}

SearchWorkerPool::Stats SearchWorkerPool::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SearchWorkerPool::worker_thread() {
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait(lock, [this]() {
            return shutdown_ || !task_queue_.empty();
        });

        // Drain what is queued before leaving
        if (shutdown_ && task_queue_.empty()) break;

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.queue_size = task_queue_.size();
        }

        lock.unlock();

        try {
            run_search(task);
        } catch (const std::exception& e) {
            std::cerr << "[Pool] Search failed: " << e.what() << "\n";
            {
                std::lock_guard<std::mutex> stats_lock(stats_mutex_);
                stats_.failed_tasks++;
            }
            task.result.set_exception(std::current_exception());
        }
    }
}

void SearchWorkerPool::run_search(Task& task) {
    SearchOutcome outcome = engine_->search(task.target, task.params);

    // Counters first, so a caller woken by the future sees them
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.completed_tasks++;
        if (outcome.cancelled) stats_.cancelled_tasks++;
    }
    task.result.set_value(std::move(outcome));
}
