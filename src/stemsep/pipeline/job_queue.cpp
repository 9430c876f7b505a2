//
//  job_queue.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-11.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/job_queue.h"

#include "stemsep/errors.h"
#include "stemsep/logging.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace stemsep {

JobQueue::JobQueue(std::shared_ptr<const SeparationOrchestrator> orchestrator,
                   std::size_t workers,
                   CompletionCallback on_complete)
    : orchestrator_(std::move(orchestrator)), on_complete_(std::move(on_complete)) {
    if (!orchestrator_) {
        throw ValidationError("JobQueue requires an orchestrator.");
    }
    const std::size_t count = std::max<std::size_t>(1, workers);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

JobQueue::~JobQueue() {
    shutdown();
}

void JobQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
        for (auto& job : jobs_) {
            job.cancel->cancel();
        }
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

JobId JobQueue::submit(SeparationRequest request, ProgressSink progress) {
    Job job;
    job.request = std::move(request);
    job.progress = std::move(progress);
    job.cancel = std::make_shared<CancellationToken>();
    JobId id = 0;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        job.id = id;
        rejected = stop_;
        if (!rejected) {
            tokens_[job.id] = job.cancel;
            jobs_.push_back(std::move(job));
        }
    }
    if (rejected) {
        STEMSEP_LOG_WARN("Job " << id << " submitted after shutdown; cancelled.");
        JobCompletion completion;
        completion.id = id;
        completion.result.status = JobStage::Cancelled;
        completion.result.error = "Job queue is shut down.";
        completion.result.metadata.last_stage = job_stage_name(JobStage::Cancelled);
        complete(std::move(completion));
        return id;
    }
    condition_.notify_one();
    return id;
}

bool JobQueue::cancel(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tokens_.find(id);
    if (it == tokens_.end()) {
        return false;
    }
    it->second->cancel();
    return true;
}

bool JobQueue::wait_for_completion(JobCompletion* out, double timeout_seconds) {
    if (!out || on_complete_) {
        return false;
    }
    std::unique_lock<std::mutex> lock(completion_mutex_);
    const auto ready = [this]() { return !completions_.empty(); };
    if (timeout_seconds < 0.0) {
        completion_condition_.wait(lock, ready);
    } else if (!completion_condition_.wait_for(
                   lock, std::chrono::duration<double>(timeout_seconds), ready)) {
        return false;
    }
    *out = std::move(completions_.front());
    completions_.pop_front();
    return true;
}

std::size_t JobQueue::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

void JobQueue::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        run_job(job);
    }
}

void JobQueue::run_job(Job& job) {
    JobCompletion completion;
    completion.id = job.id;
    try {
        completion.result = orchestrator_->run(job.request, job.progress, job.cancel.get());
    } catch (const std::exception& err) {
        STEMSEP_LOG_WARN("Job " << job.id << " rejected: " << err.what());
        completion.result.success = false;
        completion.result.status = JobStage::Failed;
        completion.result.error = err.what();
        completion.result.metadata.last_stage = job_stage_name(JobStage::Failed);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_.erase(job.id);
    }
    complete(std::move(completion));
}

void JobQueue::complete(JobCompletion completion) {
    if (on_complete_) {
        try {
            on_complete_(completion);
        } catch (const std::exception& err) {
            STEMSEP_LOG_WARN("Completion callback for job " << completion.id
                                                            << " threw: " << err.what());
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        completions_.push_back(std::move(completion));
    }
    completion_condition_.notify_one();
}

} // namespace stemsep
