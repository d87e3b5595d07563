#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief One analyzer could not produce a score.
 *
 * Never crosses the orchestrator boundary: the invocation guard converts it
 * into a failed MethodOutcome.
 */
class AnalyzerFailure : public std::runtime_error
{
public:
    explicit AnalyzerFailure(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Embedded metadata could not be read (corrupt or unsupported container)
 */
class MetadataExtractionError : public AnalyzerFailure
{
public:
    explicit MetadataExtractionError(const std::string &message) : AnalyzerFailure(message) {}
};

/**
 * @brief No usable evidence remained for aggregation. Callers must treat this as a hard failure.
 */
class InsufficientEvidence : public std::runtime_error
{
public:
    explicit InsufficientEvidence(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief A write through a persistence contract failed
 */
class PersistenceFailure : public std::runtime_error
{
public:
    explicit PersistenceFailure(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief The caller aborted the run before aggregation
 */
class DetectionCancelled : public std::runtime_error
{
public:
    explicit DetectionCancelled(const std::string &message) : std::runtime_error(message) {}
};

class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
};
