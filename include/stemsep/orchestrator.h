//
//  orchestrator.h
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "stemsep/audio_buffer.h"
#include "stemsep/config.h"
#include "stemsep/model_store.h"
#include "stemsep/separator.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stemsep {

enum class JobStage {
    Pending,
    Preprocessing,
    Analyzing,
    Separating,
    Postprocessing,
    Completed,
    Failed,
    Cancelled
};

const char* job_stage_name(JobStage stage);

/// Progress percentage reported when `stage` starts.
int job_stage_progress(JobStage stage);

/// Synchronous progress callback `(percentage, stage name)`. Exceptions thrown
/// by a sink are logged and otherwise ignored.
using ProgressSink = std::function<void(int, const std::string&)>;

/// @brief Cooperative cancellation flag, checked between pipeline stages.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

enum class QualityHint {
    Fast,
    Balanced,
    High,
    Auto
};

const char* quality_hint_name(QualityHint hint);

// Returns false for unknown names; `out` is left untouched in that case.
bool parse_quality_hint(const std::string& name, QualityHint* out);

struct SeparationRequest {
    AudioBuffer audio;
    /// Requested stem names; empty keeps every produced stem.
    std::vector<std::string> stems;
    QualityHint quality = QualityHint::Auto;
    /// Explicit separator name, tried before the quality chain.
    std::string method;
};

struct Stem {
    std::string name;
    AudioBuffer audio;
    double quality_score = 0.0;
    std::string method;
    double duration_seconds = 0.0;
};

struct SeparationAttempt {
    std::string method;
    SeparatorOutcome::Status status = SeparatorOutcome::Status::Failed;
    std::string message;
    double seconds = 0.0;
};

struct ResultMetadata {
    std::string method_used;
    double processing_time_seconds = 0.0;
    double sample_rate = 0.0;
    double duration_seconds = 0.0;
    std::map<std::string, double> quality_metrics;
    std::vector<SeparationAttempt> attempts;
    int last_progress = 0;
    std::string last_stage = "pending";
};

struct SeparationResult {
    bool success = false;
    JobStage status = JobStage::Pending;
    std::vector<Stem> stems;
    ResultMetadata metadata;
    std::vector<std::string> warnings;
    std::string error;

    const Stem* find(const std::string& name) const;
};

/// One planned separator invocation.
struct PlannedMethod {
    std::string method;
    std::size_t components = 0;
};

/// @brief Runs a separation job through its stages.
///
/// Selects and sequences separators, falls back on failure, refines stems
/// with trained Markov models and assembles the result. One orchestrator may
/// run several jobs concurrently; it holds no per-job state.
class SeparationOrchestrator {
public:
    explicit SeparationOrchestrator(SeparationConfig config = {},
                                    std::shared_ptr<ModelStore> models = nullptr,
                                    SeparatorBank bank = SeparatorBank::make_default());

    const SeparationConfig& config() const { return config_; }
    const SeparatorBank& bank() const { return bank_; }
    const std::shared_ptr<ModelStore>& models() const { return models_; }

    /// Throws ValidationError for empty, non-finite or oversized audio, a bad
    /// sample rate, empty stem names or an unknown method.
    void validate(const SeparationRequest& request) const;

    /// @brief Auto-selection priority for `audio`, without duplicates.
    std::vector<std::string> auto_priority(const AudioBuffer& audio) const;

    /// @brief Ordered separator attempts for a validated request.
    std::vector<PlannedMethod> plan(const SeparationRequest& request) const;

    /// @brief Run one job.
    ///
    /// Validation errors are thrown before any progress is emitted. All other
    /// failures end in a result with `success == false`.
    SeparationResult run(const SeparationRequest& request,
                         const ProgressSink& progress = {},
                         const CancellationToken* cancel = nullptr) const;

private:
    SeparationConfig config_;
    std::shared_ptr<ModelStore> models_;
    SeparatorBank bank_;
};

} // namespace stemsep
