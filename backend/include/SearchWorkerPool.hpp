#pragma once
// SearchWorkerPool.hpp
// Fixed set of worker threads running combo searches off the request thread
// Each job carries its own cancellation token so a caller that stops waiting
// can ask the engine to stop at the next level boundary

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "ComboSearch.hpp"

class SearchWorkerPool {
public:
    explicit SearchWorkerPool(
        size_t num_threads,
        std::shared_ptr<const ComboSearchEngine> engine
    );

    ~SearchWorkerPool();

    SearchWorkerPool(const SearchWorkerPool&) = delete;
    SearchWorkerPool& operator=(const SearchWorkerPool&) = delete;

    // Submit a search for async processing. params.cancel is replaced by the job's token
    std::future<SearchOutcome> submit(
        std::vector<std::string> target,
        SearchParams params,
        std::shared_ptr<CancellationToken> cancel
    );

    // Get pool statistics
    struct Stats {
        size_t workers = 0;
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
        size_t cancelled_tasks = 0;
    };
    Stats get_stats() const;

private:
    struct Task {
        std::vector<std::string> target;
        SearchParams params;
        std::shared_ptr<CancellationToken> cancel;
        std::promise<SearchOutcome> result;
    };

    void worker_thread();
    void run_search(Task& task);

    std::shared_ptr<const ComboSearchEngine> engine_;

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_{};
};
