#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>
#include "core/analyzer.hpp"
#include "core/cancellation_token.hpp"

struct OrchestratorSettings
{
    int max_workers = 0; // 0 = hardware concurrency
    std::chrono::milliseconds timeout{30000};
    int max_video_frames = 8;
    MediaDecodeFn decode = &MediaDecoder::decode;
};

/**
 * @brief Runs every analyzer of one upload concurrently on a bounded worker arena
 *
 * Decoding runs as the first task and each analyzer becomes one task once the
 * frames are ready. The per-upload timeout starts before decoding.
 * runAnalyses() returns once every task has reached a terminal state or the
 * timeout has expired; analyzers still running (or never started because
 * decoding overran) are reported as failed with a timeout reason and told to
 * stop. Nothing is returned while work is still in flight.
 */
class DetectionOrchestrator
{
public:
    DetectionOrchestrator(std::vector<std::shared_ptr<const Analyzer>> analyzers, OrchestratorSettings settings);

    /**
     * @brief Waits for abandoned tasks so no worker outlives the analyzers
     */
    ~DetectionOrchestrator();

    DetectionOrchestrator(const DetectionOrchestrator &) = delete;
    DetectionOrchestrator &operator=(const DetectionOrchestrator &) = delete;

    /**
     * @brief Fan out all analyzers and collect one outcome per declared method
     * @param input Artifact under test
     * @param caller_token Cancelled by the caller to abort the run
     * @return Outcomes in analyzer registration order
     * @throws DetectionCancelled if the caller cancels before all outcomes are collected;
     *         completed outcomes are discarded
     */
    std::vector<MethodOutcome> runAnalyses(const AnalysisInput &input,
                                           const CancellationToken &caller_token = CancellationToken());

    /**
     * @brief Method names the dispatched analyzers declare
     */
    std::vector<std::string> dispatchedMethods() const;

    const OrchestratorSettings &settings() const { return settings_; }

private:
    struct RunState;

    // Called from inside the arena once the request is decoded
    void dispatch(const std::shared_ptr<RunState> &state,
                  const std::shared_ptr<const AnalysisRequest> &request,
                  const std::shared_ptr<const Analyzer> &analyzer, size_t slot);

    std::vector<std::shared_ptr<const Analyzer>> analyzers_;
    OrchestratorSettings settings_;
    // Room for one worker per arena slot; the collecting thread stays outside the arena
    std::unique_ptr<tbb::global_control> parallelism_;
    tbb::task_arena arena_;
    tbb::task_group tasks_;
};
