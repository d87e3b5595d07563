#include "core/media_decoder.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace
{
    // Removes the spooled video file when decoding leaves scope
    class TemporaryFile
    {
    public:
        explicit TemporaryFile(const std::string &extension)
        {
            static std::atomic<unsigned long> counter{0};
            std::random_device rd;
            std::ostringstream name;
            name << "aigen_detector_" << rd() << "_" << counter.fetch_add(1) << extension;
            path_ = std::filesystem::temp_directory_path() / name.str();
        }

        ~TemporaryFile()
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }

        TemporaryFile(const TemporaryFile &) = delete;
        TemporaryFile &operator=(const TemporaryFile &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    std::string extensionFor(const AnalysisInput &input)
    {
        auto ext = std::filesystem::path(input.filename()).extension().string();
        return ext.empty() ? ".bin" : ext;
    }
}

bool MediaDecoder::isSupportedMimeType(const std::string &mime_type)
{
    return mime_type.rfind("image/", 0) == 0 || mime_type.rfind("video/", 0) == 0;
}

DecodedMedia MediaDecoder::decode(const AnalysisInput &input, int max_video_frames)
{
    if (input.bytes().empty())
    {
        throw AnalyzerFailure("Input contains no bytes");
    }
    if (input.isImage())
    {
        return decodeImage(input);
    }
    if (input.isVideo())
    {
        return decodeVideo(input, max_video_frames);
    }
    throw AnalyzerFailure("Unsupported MIME type: " + input.mimeType());
}

DecodedMedia MediaDecoder::decodeImage(const AnalysisInput &input)
{
    const auto &bytes = input.bytes();
    cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t *>(bytes.data()));
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (image.empty())
    {
        throw AnalyzerFailure("Failed to decode image: " + input.filename());
    }

    DecodedMedia media;
    media.source_width = image.cols;
    media.source_height = image.rows;
    media.frames.push_back(toBgr8(image));

    Logger::debug("Decoded image " + input.filename() + " (" + std::to_string(image.cols) + "x" +
                  std::to_string(image.rows) + ")");
    return media;
}

DecodedMedia MediaDecoder::decodeVideo(const AnalysisInput &input, int max_video_frames)
{
    TemporaryFile spool(extensionFor(input));
    {
        std::ofstream out(spool.path(), std::ios::binary);
        if (!out.is_open())
        {
            throw AnalyzerFailure("Could not spool video to " + spool.path().string());
        }
        const auto &bytes = input.bytes();
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    cv::VideoCapture capture(spool.path().string());
    if (!capture.isOpened())
    {
        throw AnalyzerFailure("Failed to open video: " + input.filename());
    }

    DecodedMedia media;
    media.from_video = true;
    media.video_fps = capture.get(cv::CAP_PROP_FPS);
    media.video_frame_count = static_cast<long long>(capture.get(cv::CAP_PROP_FRAME_COUNT));

    const int wanted = std::max(1, max_video_frames);
    if (media.video_frame_count > 0)
    {
        // Sample evenly across the whole clip
        const long long step = std::max<long long>(1, media.video_frame_count / wanted);
        for (long long index = 0; index < media.video_frame_count && static_cast<int>(media.frames.size()) < wanted; index += step)
        {
            capture.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(index));
            cv::Mat frame;
            if (!capture.read(frame) || frame.empty())
                break;
            media.frames.push_back(toBgr8(frame));
        }
    }
    else
    {
        // Container does not report a frame count; read sequentially
        cv::Mat frame;
        while (static_cast<int>(media.frames.size()) < wanted && capture.read(frame) && !frame.empty())
        {
            media.frames.push_back(toBgr8(frame));
        }
    }

    if (media.frames.empty())
    {
        throw AnalyzerFailure("Video contains no decodable frames: " + input.filename());
    }

    media.source_width = media.frames.front().cols;
    media.source_height = media.frames.front().rows;
    Logger::debug("Sampled " + std::to_string(media.frames.size()) + " frames from video " + input.filename());
    return media;
}

cv::Mat MediaDecoder::toBgr8(const cv::Mat &image)
{
    cv::Mat depth8;
    if (image.depth() == CV_8U)
    {
        depth8 = image;
    }
    else if (image.depth() == CV_16U)
    {
        image.convertTo(depth8, CV_8U, 1.0 / 257.0);
    }
    else
    {
        cv::normalize(image, depth8, 0, 255, cv::NORM_MINMAX, CV_8U);
    }

    cv::Mat bgr;
    switch (depth8.channels())
    {
    case 1:
        cv::cvtColor(depth8, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(depth8, bgr, cv::COLOR_BGRA2BGR);
        break;
    case 3:
        bgr = depth8.clone();
        break;
    default:
        throw AnalyzerFailure("Unsupported channel count: " + std::to_string(depth8.channels()));
    }
    return bgr;
}

cv::Mat MediaDecoder::limitDimension(const cv::Mat &frame, int max_dimension)
{
    const int longest = std::max(frame.cols, frame.rows);
    if (max_dimension <= 0 || longest <= max_dimension)
    {
        return frame;
    }
    const double scale = static_cast<double>(max_dimension) / longest;
    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(), scale, scale, cv::INTER_AREA);
    return resized;
}
