#include "core/detection_orchestrator.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace
{
    // How often the collector re-checks the caller's cancellation flag
    constexpr std::chrono::milliseconds kCancelPollInterval{20};

    int arenaConcurrency(int max_workers)
    {
        if (max_workers > 0)
            return max_workers;
        return std::max(1u, std::thread::hardware_concurrency());
    }
}

// Shared between the collector and the tasks; tasks that finish after the
// collector gave up keep it alive and write into slots nobody reads.
struct DetectionOrchestrator::RunState
{
    std::mutex mutex;
    std::condition_variable done;
    std::vector<std::optional<std::vector<MethodOutcome>>> slots;
    size_t remaining = 0;
    CancellationToken token;
};

DetectionOrchestrator::DetectionOrchestrator(std::vector<std::shared_ptr<const Analyzer>> analyzers,
                                             OrchestratorSettings settings)
    : analyzers_(std::move(analyzers)),
      settings_(settings),
      parallelism_(std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism,
                                                         arenaConcurrency(settings.max_workers) + 1)),
      arena_(arenaConcurrency(settings.max_workers), 0)
{
    if (settings_.timeout.count() <= 0)
    {
        throw ConfigurationError("detection timeout must be positive");
    }
    analyzers_.erase(std::remove(analyzers_.begin(), analyzers_.end(), nullptr), analyzers_.end());
    Logger::info("Detection orchestrator ready with " + std::to_string(analyzers_.size()) + " analyzers, " +
                 std::to_string(arenaConcurrency(settings_.max_workers)) + " workers, timeout " +
                 std::to_string(settings_.timeout.count()) + "ms");
}

DetectionOrchestrator::~DetectionOrchestrator()
{
    arena_.execute([this]
                   { tasks_.wait(); });
}

std::vector<std::string> DetectionOrchestrator::dispatchedMethods() const
{
    std::vector<std::string> methods;
    for (const auto &analyzer : analyzers_)
    {
        auto declared = analyzer->methods();
        methods.insert(methods.end(), declared.begin(), declared.end());
    }
    return methods;
}

void DetectionOrchestrator::dispatch(const std::shared_ptr<RunState> &state,
                                     const std::shared_ptr<const AnalysisRequest> &request,
                                     const std::shared_ptr<const Analyzer> &analyzer, size_t slot)
{
    tasks_.run([state, request, analyzer, slot]
               {
        std::vector<MethodOutcome> outcomes;
        if (state->token.isCancelled())
        {
            for (const auto &method : analyzer->methods())
            {
                outcomes.push_back(MethodOutcome::failed(method, "not started: " + state->token.reason()));
            }
        }
        else
        {
            outcomes = produceGuarded(*analyzer, *request);
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        state->slots[slot] = std::move(outcomes);
        --state->remaining;
        state->done.notify_all(); });
}

std::vector<MethodOutcome> DetectionOrchestrator::runAnalyses(const AnalysisInput &input,
                                                              const CancellationToken &caller_token)
{
    if (caller_token.isCancelled())
    {
        throw DetectionCancelled("detection cancelled before start: " + caller_token.reason());
    }

    if (analyzers_.empty())
    {
        return {};
    }

    auto state = std::make_shared<RunState>();
    state->slots.resize(analyzers_.size());
    state->remaining = analyzers_.size();

    const auto deadline = std::chrono::steady_clock::now() + settings_.timeout;

    // Decoding counts against the deadline; analyzers are dispatched from the decode task
    arena_.execute([this, state, input]
                   { tasks_.run([this, state, input]
                                {
        auto request = std::make_shared<const AnalysisRequest>(
            AnalysisRequest::prepare(input, settings_.max_video_frames, state->token, settings_.decode));
        if (state->token.isCancelled())
        {
            Logger::debug("Decoded " + input.filename() + " after the run was abandoned");
            return;
        }
        for (size_t i = 0; i < analyzers_.size(); ++i)
        {
            dispatch(state, request, analyzers_[i], i);
        } }); });

    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->remaining > 0)
    {
        if (caller_token.isCancelled())
        {
            state->token.cancel("run cancelled by caller");
            lock.unlock();
            Logger::warn("Detection of " + input.filename() + " cancelled by caller; discarding partial results");
            throw DetectionCancelled("detection cancelled: " + caller_token.reason());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        state->done.wait_for(lock, std::min<std::chrono::steady_clock::duration>(kCancelPollInterval, deadline - now));
    }

    std::vector<MethodOutcome> outcomes;
    size_t timed_out = 0;
    for (size_t i = 0; i < analyzers_.size(); ++i)
    {
        if (state->slots[i])
        {
            // Moved out under the lock; late tasks cannot touch this slot again
            auto &slot = *state->slots[i];
            outcomes.insert(outcomes.end(), std::make_move_iterator(slot.begin()), std::make_move_iterator(slot.end()));
            continue;
        }
        ++timed_out;
        for (const auto &method : analyzers_[i]->methods())
        {
            auto outcome = MethodOutcome::failed(method, "timed out after " + std::to_string(settings_.timeout.count()) + " ms");
            outcome.processing_time_ms = static_cast<double>(settings_.timeout.count());
            Logger::warn("Analyzer " + analyzers_[i]->name() + " timed out on " + input.filename());
            outcomes.push_back(std::move(outcome));
        }
    }
    lock.unlock();

    if (timed_out > 0)
    {
        state->token.cancel("timed out after " + std::to_string(settings_.timeout.count()) + " ms");
    }

    // A cancel that raced with the last task still wins before aggregation
    if (caller_token.isCancelled())
    {
        throw DetectionCancelled("detection cancelled: " + caller_token.reason());
    }
    return outcomes;
}
