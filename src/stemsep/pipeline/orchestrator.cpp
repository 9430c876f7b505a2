//
//  orchestrator.cpp
//  StemSep
//
//  Created by Till Toenshoff on 2026-10-10.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "stemsep/orchestrator.h"

#include "pipeline/postprocess.h"
#include "pipeline/selection.h"
#include "stemsep/errors.h"
#include "stemsep/logging.hpp"
#include "stemsep/quality.h"
#include "stemsep/spectrogram.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace stemsep {
namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Tracks the job stage, forwards progress to the sink and records the last
// event in the result metadata.
class StageTracker {
public:
    StageTracker(const ProgressSink& sink, SeparationResult* result)
        : sink_(sink), result_(result) {}

    void enter(JobStage stage) {
        const int percent = stage == JobStage::Failed || stage == JobStage::Cancelled
                                ? result_->metadata.last_progress
                                : job_stage_progress(stage);
        result_->status = stage;
        result_->metadata.last_progress = percent;
        result_->metadata.last_stage = job_stage_name(stage);
        if (!sink_) {
            return;
        }
        try {
            sink_(percent, result_->metadata.last_stage);
        } catch (const std::exception& err) {
            STEMSEP_LOG_WARN("Progress sink threw at " << result_->metadata.last_stage << ": "
                                                       << err.what());
        }
    }

private:
    const ProgressSink& sink_;
    SeparationResult* result_;
};

bool is_cancelled(const CancellationToken* cancel) {
    return cancel && cancel->is_cancelled();
}

std::vector<std::string> ordered_names(const StemMap& stems) {
    std::vector<std::string> names;
    for (const auto& name : canonical_stem_names()) {
        if (stems.count(name)) {
            names.push_back(name);
        }
    }
    for (const auto& entry : stems) {
        if (std::find(names.begin(), names.end(), entry.first) == names.end()) {
            names.push_back(entry.first);
        }
    }
    return names;
}

} // namespace

const char* job_stage_name(JobStage stage) {
    switch (stage) {
        case JobStage::Pending:
            return "pending";
        case JobStage::Preprocessing:
            return "preprocessing";
        case JobStage::Analyzing:
            return "analyzing";
        case JobStage::Separating:
            return "separating";
        case JobStage::Postprocessing:
            return "postprocessing";
        case JobStage::Completed:
            return "completed";
        case JobStage::Failed:
            return "failed";
        case JobStage::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

int job_stage_progress(JobStage stage) {
    switch (stage) {
        case JobStage::Pending:
            return 0;
        case JobStage::Preprocessing:
            return 5;
        case JobStage::Analyzing:
            return 15;
        case JobStage::Separating:
            return 30;
        case JobStage::Postprocessing:
            return 80;
        case JobStage::Completed:
            return 100;
        case JobStage::Failed:
        case JobStage::Cancelled:
            return 0;
    }
    return 0;
}

const char* quality_hint_name(QualityHint hint) {
    switch (hint) {
        case QualityHint::Fast:
            return "fast";
        case QualityHint::Balanced:
            return "balanced";
        case QualityHint::High:
            return "high";
        case QualityHint::Auto:
            return "auto";
    }
    return "auto";
}

bool parse_quality_hint(const std::string& name, QualityHint* out) {
    if (!out) {
        return false;
    }
    if (name == "fast") {
        *out = QualityHint::Fast;
    } else if (name == "balanced") {
        *out = QualityHint::Balanced;
    } else if (name == "high") {
        *out = QualityHint::High;
    } else if (name == "auto") {
        *out = QualityHint::Auto;
    } else {
        return false;
    }
    return true;
}

const Stem* SeparationResult::find(const std::string& name) const {
    for (const auto& stem : stems) {
        if (stem.name == name) {
            return &stem;
        }
    }
    return nullptr;
}

SeparationOrchestrator::SeparationOrchestrator(SeparationConfig config,
                                               std::shared_ptr<ModelStore> models,
                                               SeparatorBank bank)
    : config_(std::move(config)), models_(std::move(models)), bank_(std::move(bank)) {}

void SeparationOrchestrator::validate(const SeparationRequest& request) const {
    const AudioBuffer& audio = request.audio;
    if (audio.empty()) {
        throw ValidationError("Input audio is empty.");
    }
    if (!(audio.sample_rate() > 0.0) || !std::isfinite(audio.sample_rate())) {
        throw ValidationError("Input sample rate must be positive.");
    }
    if (audio.duration_seconds() > config_.orchestrator.max_duration_seconds) {
        std::ostringstream message;
        message << "Input is " << audio.duration_seconds() << " s long, the limit is "
                << config_.orchestrator.max_duration_seconds << " s.";
        throw ValidationError(message.str());
    }
    for (float sample : audio.samples()) {
        if (!std::isfinite(sample)) {
            throw ValidationError("Input audio contains non-finite samples.");
        }
    }
    for (const auto& name : request.stems) {
        if (name.empty()) {
            throw ValidationError("Requested stem names must not be empty.");
        }
    }
    if (!request.method.empty() && !bank_.find(request.method)) {
        throw ValidationError("Unknown separation method '" + request.method + "'.");
    }
}

std::vector<std::string> SeparationOrchestrator::auto_priority(const AudioBuffer& audio) const {
    return detail::auto_priority(bank_, config_, audio);
}

std::vector<PlannedMethod> SeparationOrchestrator::plan(const SeparationRequest& request) const {
    std::vector<PlannedMethod> methods;
    if (!request.method.empty()) {
        methods.push_back({request.method, config_.separators.components});
    }
    const auto chain = detail::quality_chain(request.quality, bank_, config_, request.audio);
    methods.insert(methods.end(), chain.begin(), chain.end());
    return detail::deduplicate(methods, bank_);
}

SeparationResult SeparationOrchestrator::run(const SeparationRequest& request,
                                             const ProgressSink& progress,
                                             const CancellationToken* cancel) const {
    validate(request);

    const auto job_start = Clock::now();
    const AudioBuffer& mix = request.audio;

    SeparationResult result;
    result.metadata.sample_rate = mix.sample_rate();
    result.metadata.duration_seconds = mix.duration_seconds();
    StageTracker tracker(progress, &result);

    auto finish_cancelled = [&]() {
        STEMSEP_LOG_INFO("Job cancelled after " << result.metadata.last_stage);
        tracker.enter(JobStage::Cancelled);
        result.success = false;
        result.error = "Job cancelled.";
        result.metadata.processing_time_seconds = seconds_since(job_start);
        return result;
    };
    auto finish_failed = [&](const std::string& message) {
        STEMSEP_LOG_ERROR("Separation failed: " << message);
        tracker.enter(JobStage::Failed);
        result.success = false;
        result.error = message;
        result.metadata.processing_time_seconds = seconds_since(job_start);
        return result;
    };

    try {
        if (is_cancelled(cancel)) {
            return finish_cancelled();
        }
        tracker.enter(JobStage::Preprocessing);
        auto stage_start = Clock::now();
        const std::vector<PlannedMethod> methods = plan(request);
        STEMSEP_LOG_INFO("Preprocessing: " << mix.size() << " samples @ " << mix.sample_rate()
                                           << " Hz, " << methods.size() << " candidate methods, "
                                           << seconds_since(stage_start) << " s");

        if (is_cancelled(cancel)) {
            return finish_cancelled();
        }
        tracker.enter(JobStage::Analyzing);
        stage_start = Clock::now();
        std::vector<std::pair<std::string, std::shared_ptr<const SeparationModel>>> refiners;
        if (models_) {
            std::vector<std::string> targets = request.stems;
            if (targets.empty()) {
                targets = canonical_stem_names();
            }
            for (const auto& name : targets) {
                auto model = models_->find(name);
                if (model && model->is_trained()) {
                    refiners.emplace_back(name, std::move(model));
                }
            }
        }
        if (stemsep_should_log("debug")) {
            std::ostringstream plan_text;
            for (const auto& planned : methods) {
                plan_text << " " << planned.method << "(" << planned.components << ")";
            }
            STEMSEP_LOG_DEBUG("Plan:" << plan_text.str());
        }
        STEMSEP_LOG_INFO("Analyzing: " << refiners.size() << " trained models apply, "
                                       << seconds_since(stage_start) << " s");

        if (is_cancelled(cancel)) {
            return finish_cancelled();
        }
        tracker.enter(JobStage::Separating);
        stage_start = Clock::now();
        StemMap candidates;
        std::shared_ptr<const Separator> producer;
        for (const auto& planned : methods) {
            const auto separator = bank_.find(planned.method);
            const auto attempt_start = Clock::now();
            SeparatorOutcome outcome = separator->try_separate(mix, planned.components, config_);

            SeparationAttempt attempt;
            attempt.method = planned.method;
            attempt.status = outcome.status;
            attempt.message = outcome.message;
            attempt.seconds = seconds_since(attempt_start);
            result.metadata.attempts.push_back(attempt);

            if (outcome.ok()) {
                candidates = std::move(outcome.stems);
                producer = separator;
                break;
            }
            STEMSEP_LOG_WARN("Separator " << planned.method << " "
                                          << outcome_status_name(outcome.status) << ": "
                                          << outcome.message << "; trying next method.");
        }
        if (!producer) {
            std::ostringstream message;
            message << "All separation methods failed.";
            for (const auto& attempt : result.metadata.attempts) {
                message << " " << attempt.method << ": " << attempt.message;
            }
            return finish_failed(message.str());
        }
        result.metadata.method_used = producer->name();
        STEMSEP_LOG_INFO("Separating: " << producer->name() << " produced " << candidates.size()
                                        << " stems in " << seconds_since(stage_start) << " s");

        if (is_cancelled(cancel)) {
            return finish_cancelled();
        }
        tracker.enter(JobStage::Postprocessing);
        stage_start = Clock::now();
        const double residual = residual_energy_ratio(candidates, mix);

        if (config_.orchestrator.relabel_components && !producer->traits().semantic_labels) {
            candidates = detail::relabel_components(candidates, config_.stft);
        }

        std::map<std::string, std::string> methods_by_stem;
        for (const auto& entry : candidates) {
            methods_by_stem[entry.first] = producer->name();
        }

        if (!refiners.empty()) {
            const Spectrogram mix_spec = compute_stft(mix, config_.stft);
            for (const auto& refiner : refiners) {
                try {
                    const TimeFrequencyMask mask = refiner.second->generate_mask(
                        mix, refiner.second->markov_config().mask_threshold, config_.stft);
                    const bool silent_mask =
                        std::none_of(mask.values.begin(), mask.values.end(),
                                     [](float value) { return value > 0.0f; });
                    AudioBuffer refined;
                    if (!silent_mask) {
                        refined = apply_mask(mix_spec, mask);
                    }
                    if (silent_mask || refined.energy() <= 0.0) {
                        result.warnings.push_back("Markov refinement of '" + refiner.first +
                                                  "' produced silence; kept the " +
                                                  producer->name() + " estimate.");
                        continue;
                    }
                    candidates[refiner.first] = std::move(refined);
                    methods_by_stem[refiner.first] = "markov";
                } catch (const NotTrainedError& err) {
                    STEMSEP_LOG_WARN("Skipping Markov refinement of " << refiner.first << ": "
                                                                      << err.what());
                }
            }
        }

        std::vector<std::string> selected;
        if (request.stems.empty()) {
            selected = ordered_names(candidates);
        } else {
            std::set<std::string> seen;
            for (const auto& name : request.stems) {
                if (!seen.insert(name).second) {
                    continue;
                }
                if (candidates.count(name)) {
                    selected.push_back(name);
                } else {
                    result.warnings.push_back("Requested stem '" + name +
                                              "' was not produced by " + producer->name() + ".");
                }
            }
        }
        if (selected.empty()) {
            return finish_failed("None of the requested stems were produced.");
        }

        StemMap finals;
        for (const auto& name : selected) {
            AudioBuffer audio = candidates.at(name);
            if (config_.orchestrator.apply_gate) {
                audio = detail::spectral_gate(audio, config_.stft, config_.orchestrator.gate_floor_db);
            }
            if (config_.orchestrator.apply_compression) {
                audio = detail::compress_peaks(audio, config_.orchestrator.compression_threshold,
                                               config_.orchestrator.compression_ratio);
            }
            finals.emplace(name, std::move(audio));
        }

        const QualityAssessor assessor;
        result.metadata.quality_metrics = assessor.assess(finals, mix);
        result.metadata.quality_metrics["residual_energy_ratio"] = residual;

        for (const auto& name : selected) {
            Stem stem;
            stem.name = name;
            stem.audio = config_.orchestrator.normalize_stems
                             ? detail::normalize_peak(finals.at(name), config_.orchestrator.headroom)
                             : finals.at(name);
            stem.quality_score = result.metadata.quality_metrics[name];
            stem.method = methods_by_stem[name];
            stem.duration_seconds = stem.audio.duration_seconds();
            result.stems.push_back(std::move(stem));
        }
        for (const auto& warning : result.warnings) {
            STEMSEP_LOG_WARN(warning);
        }
        STEMSEP_LOG_INFO("Postprocessing: " << result.stems.size() << " stems, residual energy "
                                            << residual << ", " << seconds_since(stage_start)
                                            << " s");
    } catch (const std::exception& err) {
        return finish_failed(err.what());
    }

    tracker.enter(JobStage::Completed);
    result.success = true;
    result.metadata.processing_time_seconds = seconds_since(job_start);
    STEMSEP_LOG_INFO("Job completed with " << result.metadata.method_used << " in "
                                           << result.metadata.processing_time_seconds << " s");
    return result;
}

} // namespace stemsep
