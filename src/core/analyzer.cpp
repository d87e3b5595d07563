#include "core/analyzer.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <opencv2/core.hpp>

AnalysisRequest::AnalysisRequest(AnalysisInput input,
                                 std::shared_ptr<const DecodedMedia> media,
                                 std::string decode_error,
                                 CancellationToken token)
    : input_(std::move(input)),
      media_(std::move(media)),
      decode_error_(std::move(decode_error)),
      token_(std::move(token))
{
}

AnalysisRequest AnalysisRequest::prepare(const AnalysisInput &input, int max_video_frames, CancellationToken token,
                                         const MediaDecodeFn &decode)
{
    try
    {
        auto media = std::make_shared<const DecodedMedia>(decode(input, max_video_frames));
        return AnalysisRequest(input, std::move(media), "", std::move(token));
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV could not decode " + input.filename() + ": " + std::string(e.what()));
        return AnalysisRequest(input, nullptr, std::string("decode error: ") + e.what(), std::move(token));
    }
    catch (const std::exception &e)
    {
        Logger::warn("Could not decode " + input.filename() + ": " + std::string(e.what()));
        return AnalysisRequest(input, nullptr, e.what(), std::move(token));
    }
    catch (...)
    {
        Logger::warn("Could not decode " + input.filename() + ": unknown exception");
        return AnalysisRequest(input, nullptr, "decode error: unknown exception", std::move(token));
    }
}

const DecodedMedia &AnalysisRequest::media() const
{
    if (!media_)
    {
        throw AnalyzerFailure(decode_error_.empty() ? "no decoded media available" : decode_error_);
    }
    return *media_;
}

void AnalysisRequest::throwIfCancelled(const std::string &method) const
{
    if (token_.isCancelled())
    {
        throw AnalyzerFailure(method + " stopped: " + token_.reason());
    }
}

std::vector<MethodOutcome> Analyzer::analyze(const AnalysisInput &input, int max_video_frames) const
{
    return produceGuarded(*this, AnalysisRequest::prepare(input, max_video_frames));
}

std::vector<MethodOutcome> produceGuarded(const Analyzer &analyzer, const AnalysisRequest &request)
{
    const auto declared = analyzer.methods();
    const auto start = std::chrono::steady_clock::now();

    std::vector<MethodOutcome> outcomes;
    std::string failure;
    try
    {
        outcomes = analyzer.produce(request);
    }
    catch (const cv::Exception &e)
    {
        failure = std::string("OpenCV error: ") + e.what();
    }
    catch (const std::exception &e)
    {
        failure = e.what();
    }
    catch (...)
    {
        failure = "unknown exception";
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();

    if (!failure.empty())
    {
        Logger::warn("Analyzer " + analyzer.name() + " failed on " + request.input().filename() + ": " + failure);
        outcomes.clear();
        for (const auto &method : declared)
        {
            outcomes.push_back(MethodOutcome::failed(method, failure));
        }
    }

    // Every declared method must appear exactly once
    for (const auto &method : declared)
    {
        auto found = std::find_if(outcomes.begin(), outcomes.end(),
                                  [&method](const MethodOutcome &o)
                                  { return o.method_name == method; });
        if (found == outcomes.end())
        {
            outcomes.push_back(MethodOutcome::failed(method, "analyzer produced no outcome"));
        }
    }

    for (auto &outcome : outcomes)
    {
        if (outcome.processing_time_ms <= 0.0)
        {
            outcome.processing_time_ms = elapsed_ms;
        }
        if (outcome.isOk())
        {
            Logger::debug(outcome.method_name + " scored " + std::to_string(*outcome.score));
        }
        else
        {
            Logger::info(outcome.method_name + " " + methodStatusName(outcome.status) + ": " + outcome.reason);
        }
    }
    return outcomes;
}
