#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include "core/analyzer.hpp"

/**
 * @brief Tunables shared by the pixel-domain signals
 */
struct ForensicsSettings
{
    int ela_quality = 90;                       // JPEG quality used for re-encoding
    int tile_size = 32;                         // Edge length of the analysis tiles in pixels
    double texture_smooth_variance = 25.0;      // Laplacian variance below which a tile counts as smooth
    double texture_uniformity_threshold = 0.35; // Smooth tile ratio where texture turns suspicious
    int max_dimension = 1024;                   // Frames are downscaled to this longest side first
    std::string artifact_dir;                   // Where evidence images (ELA difference) are written; empty disables
};

/**
 * @brief Score of one frame for one signal
 *
 * Either score is set, or skip_reason explains why the frame carries no
 * applicable evidence for the signal.
 */
struct FrameScore
{
    std::optional<double> score;
    std::string skip_reason;
    std::string summary;
    nlohmann::json detail = nlohmann::json::object();
    cv::Mat artifact; // visualization of the evidence, empty when the signal has none
};

/**
 * @brief Base for the signals that score decoded frames
 *
 * Scores every sampled frame and reports the mean; frames without applicable
 * evidence are left out and the signal is skipped when none remain.
 */
class PixelSignal : public Analyzer
{
public:
    explicit PixelSignal(ForensicsSettings settings) : settings_(settings) {}

    std::vector<std::string> methods() const override { return {name()}; }
    std::vector<MethodOutcome> produce(const AnalysisRequest &request) const override;

    virtual FrameScore scoreFrame(const cv::Mat &bgr) const = 0;

    const ForensicsSettings &settings() const { return settings_; }

protected:
    ForensicsSettings settings_;

private:
    std::string writeArtifact(const cv::Mat &artifact, const std::string &filename) const;
};

/**
 * @brief Sensor-pattern-noise consistency ("prnu")
 *
 * Extracts the noise residual left by non-local means denoising and measures
 * its strength and spread across tiles. Weak or erratic residual energy
 * scores as suspicious.
 */
class NoiseResidualSignal : public PixelSignal
{
public:
    static constexpr const char *kMethodName = "prnu";

    using PixelSignal::PixelSignal;
    std::string name() const override { return kMethodName; }
    FrameScore scoreFrame(const cv::Mat &bgr) const override;
};

/**
 * @brief Compression-error-level consistency ("ela")
 */
class ErrorLevelSignal : public PixelSignal
{
public:
    static constexpr const char *kMethodName = "ela";

    using PixelSignal::PixelSignal;
    std::string name() const override { return kMethodName; }
    FrameScore scoreFrame(const cv::Mat &bgr) const override;
};

/**
 * @brief Texture smoothness uniformity ("texture")
 */
class TextureSmoothnessSignal : public PixelSignal
{
public:
    static constexpr const char *kMethodName = "texture";

    using PixelSignal::PixelSignal;
    std::string name() const override { return kMethodName; }
    FrameScore scoreFrame(const cv::Mat &bgr) const override;
};

/**
 * @brief The three pixel signals behind one analyzer
 *
 * Each signal runs through its own guard, so one failing signal never
 * suppresses the other two. The orchestrator dispatches the signals
 * individually through signals().
 */
class PixelForensicsAnalyzer : public Analyzer
{
public:
    explicit PixelForensicsAnalyzer(ForensicsSettings settings = ForensicsSettings());

    std::string name() const override { return "pixel_forensics"; }
    std::vector<std::string> methods() const override;
    std::vector<MethodOutcome> produce(const AnalysisRequest &request) const override;

    const std::vector<std::shared_ptr<const PixelSignal>> &signals() const { return signals_; }

private:
    std::vector<std::shared_ptr<const PixelSignal>> signals_;
};
