//
//  job_queue.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-11.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/orchestrator.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace stemsep {

using JobId = std::uint64_t;

struct JobCompletion {
    JobId id = 0;
    SeparationResult result;
};

using CompletionCallback = std::function<void(const JobCompletion&)>;

/// @brief Fixed worker pool running separation jobs.
///
/// Every submitted job produces exactly one completion, delivered to the
/// callback when one is set (on the worker thread) and otherwise queued for
/// `wait_for_completion()`. Jobs still queued at shutdown complete as
/// cancelled.
class JobQueue {
public:
    JobQueue(std::shared_ptr<const SeparationOrchestrator> orchestrator,
             std::size_t workers,
             CompletionCallback on_complete = {});
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    /// Jobs submitted after shutdown() complete immediately as cancelled.
    JobId submit(SeparationRequest request, ProgressSink progress = {});

    /// Returns false for unknown or already completed jobs.
    bool cancel(JobId id);

    /// @brief Pop the next completion.
    ///
    /// Blocks up to `timeout_seconds` (forever when negative). Returns false
    /// on timeout or when a completion callback is installed.
    bool wait_for_completion(JobCompletion* out, double timeout_seconds = -1.0);

    /// Queued plus running jobs.
    std::size_t active() const;

    std::size_t worker_count() const { return workers_.size(); }

    /// Cancels queued jobs and joins the workers. Called by the destructor.
    void shutdown();

private:
    struct Job {
        JobId id = 0;
        SeparationRequest request;
        ProgressSink progress;
        std::shared_ptr<CancellationToken> cancel;
    };

    void worker_loop();
    void run_job(Job& job);
    void complete(JobCompletion completion);

    std::shared_ptr<const SeparationOrchestrator> orchestrator_;
    CompletionCallback on_complete_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Job> jobs_;
    std::unordered_map<JobId, std::shared_ptr<CancellationToken>> tokens_;
    JobId next_id_ = 1;
    bool stop_ = false;

    std::mutex completion_mutex_;
    std::condition_variable completion_condition_;
    std::deque<JobCompletion> completions_;

    std::vector<std::thread> workers_;
};

} // namespace stemsep
