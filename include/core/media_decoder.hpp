#pragma once

#include <functional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/analysis_types.hpp"

/**
 * @brief Decoded pixel content of one AnalysisInput
 *
 * Holds a single frame for still images and a sampled frame set for video.
 * Shared read-only by analyzers once decoding has finished.
 */
struct DecodedMedia
{
    std::vector<cv::Mat> frames; // BGR, 8-bit, 3 channels
    bool from_video = false;
    int source_width = 0;
    int source_height = 0;
    double video_fps = 0.0;
    long long video_frame_count = 0;

    bool empty() const { return frames.empty(); }
};

using MediaDecodeFn = std::function<DecodedMedia(const AnalysisInput &, int)>;

/**
 * @brief Turns uploaded bytes into frames using OpenCV
 */
class MediaDecoder
{
public:
    /**
     * @brief Decode an input into frames
     * @param input Artifact under test
     * @param max_video_frames Upper bound of frames sampled from a video
     * @return Decoded frames
     * @throws AnalyzerFailure when the bytes cannot be decoded or the MIME type is unsupported
     */
    static DecodedMedia decode(const AnalysisInput &input, int max_video_frames);

    /**
     * @brief Downscale a frame so its longest side is at most max_dimension
     */
    static cv::Mat limitDimension(const cv::Mat &frame, int max_dimension);

    static bool isSupportedMimeType(const std::string &mime_type);

private:
    static DecodedMedia decodeImage(const AnalysisInput &input);
    static DecodedMedia decodeVideo(const AnalysisInput &input, int max_video_frames);
    static cv::Mat toBgr8(const cv::Mat &image);
};
