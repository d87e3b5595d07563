#include "core/pixel_forensics_analyzer.hpp"
#include "core/detection_errors.hpp"
#include "core/media_decoder.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/photo.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <cmath>
#include <numeric>
#include <sstream>
#include <iomanip>

namespace
{
    // Residual deviation (8-bit levels) typical of camera sensor noise after h=10 denoising
    constexpr double kReferenceResidualEnergy = 3.0;
    // Mean re-encoding error (8-bit levels) typical of detailed camera content
    constexpr double kReferenceErrorLevel = 4.0;
    // Below this gray-level deviation a frame has no structure to measure
    constexpr double kFlatFrameDeviation = 1.0;

    struct TileStats
    {
        std::vector<double> values;
        double mean = 0.0;
        double stddev = 0.0;
    };

    std::vector<cv::Rect> tileGrid(const cv::Size &size, int tile_size)
    {
        std::vector<cv::Rect> tiles;
        for (int y = 0; y + tile_size <= size.height; y += tile_size)
        {
            for (int x = 0; x + tile_size <= size.width; x += tile_size)
            {
                tiles.emplace_back(x, y, tile_size, tile_size);
            }
        }
        return tiles;
    }

    TileStats summarize(std::vector<double> values)
    {
        TileStats stats;
        stats.values = std::move(values);
        if (stats.values.empty())
            return stats;
        stats.mean = std::accumulate(stats.values.begin(), stats.values.end(), 0.0) / stats.values.size();
        double sq = 0.0;
        for (double v : stats.values)
        {
            sq += (v - stats.mean) * (v - stats.mean);
        }
        stats.stddev = std::sqrt(sq / stats.values.size());
        return stats;
    }

    double grayDeviation(const cv::Mat &gray)
    {
        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);
        return stddev[0];
    }

    std::string fixed(double value, int precision = 3)
    {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << value;
        return ss.str();
    }

    FrameScore skip(const std::string &reason)
    {
        FrameScore result;
        result.skip_reason = reason;
        return result;
    }
}

std::vector<MethodOutcome> PixelSignal::produce(const AnalysisRequest &request) const
{
    const std::string method = name();
    const DecodedMedia &media = request.media();

    std::vector<double> scores;
    std::vector<std::string> summaries;
    nlohmann::json frame_details = nlohmann::json::array();
    std::string first_skip_reason;
    std::string artifact_path;

    for (size_t i = 0; i < media.frames.size(); ++i)
    {
        request.throwIfCancelled(method);

        const cv::Mat frame = MediaDecoder::limitDimension(media.frames[i], settings_.max_dimension);
        FrameScore frame_score = scoreFrame(frame);
        if (!frame_score.score)
        {
            if (first_skip_reason.empty())
                first_skip_reason = frame_score.skip_reason;
            Logger::debug(method + " skipped frame " + std::to_string(i) + ": " + frame_score.skip_reason);
            continue;
        }
        if (artifact_path.empty() && !frame_score.artifact.empty() && !settings_.artifact_dir.empty())
        {
            artifact_path = writeArtifact(frame_score.artifact, request.input().filename());
        }
        scores.push_back(*frame_score.score);
        summaries.push_back(frame_score.summary);
        frame_score.detail["frame_index"] = i;
        frame_details.push_back(std::move(frame_score.detail));
    }

    if (scores.empty())
    {
        return {MethodOutcome::skipped(method, first_skip_reason.empty() ? "no frames to analyze" : first_skip_reason)};
    }

    const double mean_score = std::accumulate(scores.begin(), scores.end(), 0.0) / scores.size();
    if (!media.from_video)
    {
        nlohmann::json detail = frame_details.front();
        if (!artifact_path.empty())
            detail["artifact_path"] = artifact_path;
        return {MethodOutcome::ok(method, mean_score, summaries.front(), detail)};
    }

    nlohmann::json detail = {
        {"frames_analyzed", scores.size()},
        {"frames_sampled", media.frames.size()},
        {"frames", frame_details}};
    if (!artifact_path.empty())
        detail["artifact_path"] = artifact_path;
    const std::string summary = method + ": mean over " + std::to_string(scores.size()) +
                                " video frames " + fixed(mean_score) + " (first frame: " + summaries.front() + ")";
    return {MethodOutcome::ok(method, mean_score, summary, detail)};
}

std::string PixelSignal::writeArtifact(const cv::Mat &artifact, const std::string &filename) const
{
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    const std::string stem = std::filesystem::path(filename).stem().string();
    const std::filesystem::path path = std::filesystem::path(settings_.artifact_dir) /
                                       (stem + "_" + name() + "_" + std::to_string(stamp) + "_" +
                                        std::to_string(++counter) + ".png");
    try
    {
        std::filesystem::create_directories(settings_.artifact_dir);
        if (cv::imwrite(path.string(), artifact))
        {
            return path.string();
        }
        Logger::warn("Could not write " + name() + " artifact " + path.string());
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not write " + name() + " artifact " + path.string() + ": " + e.what());
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        Logger::warn("Could not create artifact directory " + settings_.artifact_dir + ": " + e.what());
    }
    return "";
}

FrameScore NoiseResidualSignal::scoreFrame(const cv::Mat &bgr) const
{
    const int tile = settings_.tile_size;
    if (bgr.rows < 2 * tile || bgr.cols < 2 * tile)
    {
        return skip("image too small for noise residual analysis (" + std::to_string(bgr.cols) + "x" +
                    std::to_string(bgr.rows) + ")");
    }

    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    if (grayDeviation(gray) < kFlatFrameDeviation)
    {
        return skip("flat image carries no sensor noise to measure");
    }

    cv::Mat denoised;
    cv::fastNlMeansDenoising(gray, denoised, 10.0f, 7, 21);

    cv::Mat gray_f, denoised_f, residual;
    gray.convertTo(gray_f, CV_32F);
    denoised.convertTo(denoised_f, CV_32F);
    cv::subtract(gray_f, denoised_f, residual);

    std::vector<double> energies;
    for (const auto &rect : tileGrid(residual.size(), tile))
    {
        cv::Scalar mean, stddev;
        cv::meanStdDev(residual(rect), mean, stddev);
        energies.push_back(stddev[0]);
    }
    const TileStats stats = summarize(std::move(energies));

    const double absence = std::clamp(1.0 - stats.mean / kReferenceResidualEnergy, 0.0, 1.0);
    const double inconsistency = stats.mean > 1e-6 ? std::clamp(stats.stddev / stats.mean, 0.0, 1.0) : 1.0;
    const double score = std::clamp(0.5 * absence + 0.5 * inconsistency, 0.0, 1.0);

    FrameScore result;
    result.score = score;
    result.detail = {
        {"tiles", stats.values.size()},
        {"mean_residual_energy", stats.mean},
        {"residual_energy_stddev", stats.stddev},
        {"pattern_absence", absence},
        {"pattern_inconsistency", inconsistency}};

    std::string analysis;
    if (absence > 0.5)
        analysis = "weak sensor noise residual";
    else if (inconsistency > 0.5)
        analysis = "inconsistent sensor noise residual across regions";
    else
        analysis = "sensor noise residual consistent with camera capture";
    result.summary = "prnu: " + analysis + " (energy " + fixed(stats.mean, 2) + ", variation " + fixed(inconsistency, 2) + ")";
    result.detail["analysis"] = analysis;
    return result;
}

FrameScore ErrorLevelSignal::scoreFrame(const cv::Mat &bgr) const
{
    const int tile = settings_.tile_size;
    if (bgr.rows < 2 * tile || bgr.cols < 2 * tile)
    {
        return skip("image too small for error level analysis (" + std::to_string(bgr.cols) + "x" +
                    std::to_string(bgr.rows) + ")");
    }

    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    if (grayDeviation(gray) < kFlatFrameDeviation)
    {
        return skip("flat image has no compression error structure");
    }

    std::vector<uint8_t> encoded;
    if (!cv::imencode(".jpg", bgr, encoded, {cv::IMWRITE_JPEG_QUALITY, settings_.ela_quality}))
    {
        throw AnalyzerFailure("JPEG re-encoding failed at quality " + std::to_string(settings_.ela_quality));
    }
    cv::Mat recompressed = cv::imdecode(encoded, cv::IMREAD_COLOR);
    if (recompressed.empty() || recompressed.size() != bgr.size())
    {
        throw AnalyzerFailure("re-encoded JPEG could not be decoded");
    }

    cv::Mat diff, diff_gray, error;
    cv::absdiff(bgr, recompressed, diff);
    cv::cvtColor(diff, diff_gray, cv::COLOR_BGR2GRAY);
    diff_gray.convertTo(error, CV_32F);

    std::vector<double> levels;
    for (const auto &rect : tileGrid(error.size(), tile))
    {
        levels.push_back(cv::mean(error(rect))[0]);
    }
    const TileStats stats = summarize(std::move(levels));
    double max_level = 0.0;
    cv::minMaxLoc(error, nullptr, &max_level);

    const double uniformity = stats.mean > 1e-6 ? 1.0 - std::clamp(stats.stddev / stats.mean, 0.0, 1.0) : 1.0;
    const double absence = std::clamp(1.0 - stats.mean / kReferenceErrorLevel, 0.0, 1.0);
    const double score = std::clamp(0.6 * uniformity + 0.4 * absence, 0.0, 1.0);

    FrameScore result;
    result.score = score;
    result.detail = {
        {"quality", settings_.ela_quality},
        {"tiles", stats.values.size()},
        {"mean_error_level", stats.mean},
        {"error_level_stddev", stats.stddev},
        {"max_error_level", max_level},
        {"uniformity", uniformity},
        {"error_absence", absence}};

    std::string analysis;
    if (uniformity > 0.6)
        analysis = "unnaturally uniform compression error";
    else if (absence > 0.7)
        analysis = "almost no compression error structure";
    else
        analysis = "compression error varies naturally across regions";
    if (!settings_.artifact_dir.empty())
    {
        // Amplified difference image, as ELA viewers show it
        diff.convertTo(result.artifact, CV_8U, 10.0);
    }
    result.summary = "ela: " + analysis + " (uniformity " + fixed(uniformity, 2) + ", mean error " + fixed(stats.mean, 2) + ")";
    result.detail["analysis"] = analysis;
    return result;
}

FrameScore TextureSmoothnessSignal::scoreFrame(const cv::Mat &bgr) const
{
    const auto tiles = tileGrid(bgr.size(), settings_.tile_size);
    if (tiles.size() < 4)
    {
        return skip("image too small for texture tiling (" + std::to_string(tiles.size()) + " tiles)");
    }

    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    if (grayDeviation(gray) < kFlatFrameDeviation)
    {
        return skip("no textured region to analyze (uniform frame)");
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    std::vector<double> variances;
    size_t smooth_tiles = 0;
    for (const auto &rect : tiles)
    {
        cv::Scalar mean, stddev;
        cv::meanStdDev(laplacian(rect), mean, stddev);
        const double variance = stddev[0] * stddev[0];
        variances.push_back(variance);
        if (variance < settings_.texture_smooth_variance)
            ++smooth_tiles;
    }
    const TileStats stats = summarize(std::move(variances));

    const double ratio = static_cast<double>(smooth_tiles) / tiles.size();
    const double threshold = settings_.texture_uniformity_threshold;
    double score;
    if (ratio <= threshold)
        score = threshold > 0.0 ? 0.5 * ratio / threshold : 0.5;
    else
        score = threshold < 1.0 ? 0.5 + 0.5 * (ratio - threshold) / (1.0 - threshold) : 1.0;
    score = std::clamp(score, 0.0, 1.0);

    cv::Mat edges;
    cv::Canny(gray, edges, 100, 200);
    const double edge_density = static_cast<double>(cv::countNonZero(edges)) / (edges.rows * edges.cols);

    cv::Mat sobel_x, sobel_y, magnitude;
    cv::Sobel(gray, sobel_x, CV_64F, 1, 0, 3);
    cv::Sobel(gray, sobel_y, CV_64F, 0, 1, 3);
    cv::magnitude(sobel_x, sobel_y, magnitude);
    const double gradient_mean = cv::mean(magnitude)[0];

    FrameScore result;
    result.score = score;
    result.detail = {
        {"tiles", tiles.size()},
        {"smooth_tiles", smooth_tiles},
        {"smooth_ratio", ratio},
        {"uniformity_threshold", threshold},
        {"mean_tile_variance", stats.mean},
        {"edge_density", edge_density},
        {"gradient_mean", gradient_mean}};

    const std::string analysis = ratio > threshold
                                     ? "large regions of unnaturally uniform smoothness"
                                     : "texture variance consistent with natural content";
    result.summary = "texture: " + analysis + " (" + fixed(ratio * 100.0, 1) + "% smooth tiles)";
    result.detail["analysis"] = analysis;
    return result;
}

PixelForensicsAnalyzer::PixelForensicsAnalyzer(ForensicsSettings settings)
{
    signals_.push_back(std::make_shared<NoiseResidualSignal>(settings));
    signals_.push_back(std::make_shared<ErrorLevelSignal>(settings));
    signals_.push_back(std::make_shared<TextureSmoothnessSignal>(settings));
}

std::vector<std::string> PixelForensicsAnalyzer::methods() const
{
    std::vector<std::string> names;
    for (const auto &signal : signals_)
    {
        names.push_back(signal->name());
    }
    return names;
}

std::vector<MethodOutcome> PixelForensicsAnalyzer::produce(const AnalysisRequest &request) const
{
    std::vector<MethodOutcome> outcomes;
    for (const auto &signal : signals_)
    {
        auto signal_outcomes = produceGuarded(*signal, request);
        outcomes.insert(outcomes.end(), signal_outcomes.begin(), signal_outcomes.end());
    }
    return outcomes;
}
