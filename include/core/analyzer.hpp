#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/analysis_types.hpp"
#include "core/cancellation_token.hpp"
#include "core/media_decoder.hpp"

/**
 * @brief Everything one analyzer invocation may read
 *
 * Owns a copy of the input (the byte buffer itself is shared) and the decoded
 * frames, so a task that finishes after its run was abandoned never touches
 * caller-owned memory.
 */
class AnalysisRequest
{
public:
    AnalysisRequest(AnalysisInput input,
                    std::shared_ptr<const DecodedMedia> media,
                    std::string decode_error,
                    CancellationToken token);

    /**
     * @brief Decode the input once and wrap it for analyzers
     *
     * Decode failures are recorded, not thrown: analyzers that need pixels
     * report them through media().
     */
    static AnalysisRequest prepare(const AnalysisInput &input, int max_video_frames,
                                   CancellationToken token = CancellationToken(),
                                   const MediaDecodeFn &decode = &MediaDecoder::decode);

    const AnalysisInput &input() const { return input_; }
    bool hasMedia() const { return media_ != nullptr; }

    /**
     * @throws AnalyzerFailure carrying the decode error when no frames are available
     */
    const DecodedMedia &media() const;

    const std::string &decodeError() const { return decode_error_; }
    const CancellationToken &token() const { return token_; }

    /**
     * @throws AnalyzerFailure if the run has been cancelled or timed out
     */
    void throwIfCancelled(const std::string &method) const;

private:
    AnalysisInput input_;
    std::shared_ptr<const DecodedMedia> media_;
    std::string decode_error_;
    CancellationToken token_;
};

/**
 * @brief Pluggable evidence source
 *
 * An analyzer declares the method names it reports and produces one outcome per
 * method. The aggregator only ever sees those names and their weights.
 */
class Analyzer
{
public:
    virtual ~Analyzer() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> methods() const = 0;

    /**
     * @brief Run the analysis. May throw; callers go through produceGuarded().
     */
    virtual std::vector<MethodOutcome> produce(const AnalysisRequest &request) const = 0;

    /**
     * @brief Convenience entry point that decodes the input and runs the guarded analysis
     */
    std::vector<MethodOutcome> analyze(const AnalysisInput &input, int max_video_frames = 8) const;
};

/**
 * @brief Invoke an analyzer so that no exception escapes
 *
 * Exceptions of any type become failed outcomes for every declared method, declared methods
 * that produced nothing are reported as failed, and processing time is recorded
 * on outcomes that did not measure it themselves.
 */
std::vector<MethodOutcome> produceGuarded(const Analyzer &analyzer, const AnalysisRequest &request);
