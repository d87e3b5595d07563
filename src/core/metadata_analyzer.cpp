#include "core/metadata_analyzer.hpp"
#include "core/detection_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>

namespace
{
    constexpr size_t kMaxDetailValueLength = 256;

    struct ParsedTimestamp
    {
        int year, month, day, hour, minute, second;
    };

    // Days since 1970-01-01 for a proleptic Gregorian date
    long long daysFromCivil(int y, int m, int d)
    {
        y -= m <= 2 ? 1 : 0;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const long long yoe = y - era * 400;
        const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    bool parseExifTimestamp(const std::string &text, ParsedTimestamp &out)
    {
        char trailing = 0;
        const int matched = std::sscanf(text.c_str(), "%4d:%2d:%2d %2d:%2d:%2d%c",
                                        &out.year, &out.month, &out.day, &out.hour, &out.minute, &out.second, &trailing);
        return matched == 6;
    }

    std::vector<double> parseNumberList(const std::string &text)
    {
        std::vector<double> values;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            try
            {
                values.push_back(std::stod(item));
            }
            catch (const std::exception &)
            {
                return {};
            }
        }
        return values;
    }

    std::string joinFacts(const std::vector<MetadataIndicator> &indicators)
    {
        std::string joined;
        for (const auto &indicator : indicators)
        {
            if (!joined.empty())
                joined += "; ";
            joined += indicator.fact;
        }
        return joined;
    }
}

MetadataAnalyzer::MetadataAnalyzer(MetadataScoringPolicy policy)
    : policy_(std::move(policy))
{
    for (const auto &pattern : policy_.generator_patterns)
    {
        generator_patterns_.emplace_back(pattern, std::regex::icase | std::regex::ECMAScript);
    }
}

std::vector<MethodOutcome> MetadataAnalyzer::produce(const AnalysisRequest &request) const
{
    request.throwIfCancelled(kMethodName);
    return {analyzeMetadata(request.input())};
}

MethodOutcome MetadataAnalyzer::analyzeMetadata(const AnalysisInput &input) const
{
    if (input.isVideo())
    {
        return MethodOutcome::skipped(kMethodName, "embedded metadata extraction supports still images only");
    }

    const auto start = std::chrono::steady_clock::now();
    EmbeddedMetadata metadata;
    try
    {
        metadata = ExifReader::read(input.bytes());
    }
    catch (const MetadataExtractionError &e)
    {
        Logger::warn("Metadata extraction failed for " + input.filename() + ": " + e.what());
        return MethodOutcome::failed(kMethodName, std::string("metadata extraction failed: ") + e.what());
    }

    const auto assessment = assess(metadata, std::time(nullptr));

    nlohmann::json indicators = nlohmann::json::array();
    nlohmann::json increments = nlohmann::json::object();
    for (const auto &indicator : assessment.indicators)
    {
        indicators.push_back(indicator.fact);
        increments[indicator.id] = indicator.increment;
    }

    nlohmann::json fields = nlohmann::json::object();
    for (const auto &[key, value] : metadata.fields)
    {
        fields[key] = value.size() > kMaxDetailValueLength ? ExifReader::toUtf8(value, kMaxDetailValueLength) + "..." : value;
    }

    nlohmann::json detail = {
        {"container", metadata.container},
        {"fields_found", metadata.fields.size()},
        {"fields", fields},
        {"indicators", indicators},
        {"increments", increments}};

    const std::string summary = assessment.indicators.empty()
                                    ? "metadata consistent with camera capture"
                                    : "metadata: " + joinFacts(assessment.indicators);

    auto outcome = MethodOutcome::ok(kMethodName, assessment.score, summary, detail);
    outcome.processing_time_ms = std::chrono::duration<double, std::milli>(
                                     std::chrono::steady_clock::now() - start)
                                     .count();
    return outcome;
}

MetadataAssessment MetadataAnalyzer::assess(const EmbeddedMetadata &metadata, std::time_t now) const
{
    MetadataAssessment assessment;

    if (metadata.empty())
    {
        assessment.indicators.push_back({"no_metadata", "no metadata present", policy_.no_metadata});
    }
    else
    {
        if (!metadata.has("Make") && !metadata.has("Model") && !metadata.has("XMP:Make") && !metadata.has("XMP:Model"))
        {
            assessment.indicators.push_back({"missing_device", "no capture device identifiers (camera make/model)", policy_.missing_device});
        }

        std::vector<std::string> missing_exposure;
        for (const char *field : {"ExposureTime", "FNumber", "ISOSpeedRatings"})
        {
            if (!metadata.has(field))
                missing_exposure.push_back(field);
        }
        if (!missing_exposure.empty())
        {
            std::string fact = "incomplete exposure settings (missing ";
            for (size_t i = 0; i < missing_exposure.size(); ++i)
            {
                fact += (i > 0 ? ", " : "") + missing_exposure[i];
            }
            assessment.indicators.push_back({"missing_exposure", fact + ")", policy_.missing_exposure});
        }

        if (!metadata.has("LensModel") && !metadata.has("LensInfo") && !metadata.has("LensMake"))
        {
            assessment.indicators.push_back({"missing_lens", "no lens information", policy_.missing_lens});
        }

        if (!metadata.has("GPSLatitude") || !metadata.has("GPSLongitude"))
        {
            assessment.indicators.push_back({"missing_geolocation", "no geolocation", policy_.missing_geolocation});
        }

        checkGenerator(metadata, assessment);
        checkTimestamps(metadata, now, assessment);
        checkExposureValues(metadata, assessment);
    }

    double total = 0.0;
    for (const auto &indicator : assessment.indicators)
    {
        total += indicator.increment;
    }
    assessment.score = std::clamp(total, 0.0, 1.0);
    return assessment;
}

void MetadataAnalyzer::checkGenerator(const EmbeddedMetadata &metadata, MetadataAssessment &assessment) const
{
    static const std::vector<std::string> software_fields = {
        "Software", "XMP:CreatorTool", "Artist", "ImageDescription", "Comment",
        "PNG:Software", "PNG:Comment", "PNG:Description", "PNG:Source"};

    for (const auto &field : software_fields)
    {
        const std::string value = metadata.get(field);
        if (value.empty())
            continue;
        for (const auto &pattern : generator_patterns_)
        {
            if (std::regex_search(value, pattern))
            {
                assessment.indicators.push_back({"generator_software", "generator software signature: " + value, policy_.generator_software});
                return;
            }
        }
    }

    const std::string source_type = metadata.get("XMP:DigitalSourceType");
    if (source_type.find("trainedAlgorithmicMedia") != std::string::npos ||
        source_type.find("compositeSynthetic") != std::string::npos)
    {
        assessment.indicators.push_back({"generator_software", "declared synthetic digital source type: " + source_type, policy_.generator_software});
        return;
    }

    for (const char *key : {"PNG:parameters", "PNG:prompt", "PNG:workflow", "PNG:Dream", "PNG:sd-metadata"})
    {
        if (metadata.has(key))
        {
            assessment.indicators.push_back({"generation_parameters", std::string("embedded generation parameters (") + key + ")", policy_.generation_parameters});
            return;
        }
    }
}

void MetadataAnalyzer::checkTimestamps(const EmbeddedMetadata &metadata, std::time_t now, MetadataAssessment &assessment) const
{
    const long long now_days = static_cast<long long>(now) / 86400;

    for (const char *field : {"DateTimeOriginal", "DateTimeDigitized", "DateTime"})
    {
        if (!metadata.has(field))
            continue;
        const std::string value = metadata.get(field);
        ParsedTimestamp ts{};
        if (!parseExifTimestamp(value, ts) || ts.month < 1 || ts.month > 12 || ts.day < 1 || ts.day > 31 ||
            ts.hour > 23 || ts.minute > 59 || ts.second > 60)
        {
            assessment.indicators.push_back({"implausible_timestamp", std::string("implausible creation timestamp: ") + field + "=" + value, policy_.implausible_timestamp});
            return;
        }
        const long long days = daysFromCivil(ts.year, ts.month, ts.day);
        if (ts.year < 1970 || days > now_days + 1)
        {
            assessment.indicators.push_back({"implausible_timestamp", std::string("implausible creation timestamp: ") + field + "=" + value, policy_.implausible_timestamp});
            return;
        }
    }

    if (metadata.has("DateTimeOriginal") && metadata.has("DateTimeDigitized") &&
        metadata.get("DateTimeOriginal") != metadata.get("DateTimeDigitized"))
    {
        assessment.indicators.push_back({"implausible_timestamp",
                                         "inconsistent creation timestamps: original " + metadata.get("DateTimeOriginal") +
                                             " vs digitized " + metadata.get("DateTimeDigitized"),
                                         policy_.implausible_timestamp});
    }
}

void MetadataAnalyzer::checkExposureValues(const EmbeddedMetadata &metadata, MetadataAssessment &assessment) const
{
    std::vector<std::string> problems;

    auto fnumber = parseNumberList(metadata.get("FNumber"));
    if (!fnumber.empty() && (fnumber.front() < 0.7 || fnumber.front() > 64.0))
    {
        problems.push_back("f-number " + metadata.get("FNumber"));
    }
    auto iso = parseNumberList(metadata.get("ISOSpeedRatings"));
    if (!iso.empty() && (iso.front() < 50.0 || iso.front() > 409600.0))
    {
        problems.push_back("ISO " + metadata.get("ISOSpeedRatings"));
    }
    auto exposure = parseNumberList(metadata.get("ExposureTime"));
    if (!exposure.empty() && (exposure.front() <= 0.0 || exposure.front() > 3600.0))
    {
        problems.push_back("exposure time " + metadata.get("ExposureTime"));
    }

    if (!problems.empty())
    {
        std::string fact = "unrealistic exposure values (";
        for (size_t i = 0; i < problems.size(); ++i)
        {
            fact += (i > 0 ? ", " : "") + problems[i];
        }
        assessment.indicators.push_back({"unrealistic_exposure", fact + ")", policy_.unrealistic_exposure});
    }

    auto latitude = parseNumberList(metadata.get("GPSLatitude"));
    auto longitude = parseNumberList(metadata.get("GPSLongitude"));
    if (!latitude.empty() && !longitude.empty() &&
        std::all_of(latitude.begin(), latitude.end(), [](double v)
                    { return v == 0.0; }) &&
        std::all_of(longitude.begin(), longitude.end(), [](double v)
                    { return v == 0.0; }))
    {
        assessment.indicators.push_back({"zero_gps", "zero GPS coordinates", policy_.zero_gps});
    }
}
