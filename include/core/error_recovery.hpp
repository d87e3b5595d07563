#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Retry mechanism with exponential backoff; rethrows the last failure
    template <typename Func, typename... Args>
    static auto retryWithBackoff(Func func, int max_retries, const std::string &operation_name, Args &&...args)
        -> decltype(func(std::forward<Args>(args)...))
    {
        if (max_retries < 1)
        {
            max_retries = 1;
        }

        for (int attempt = 0; attempt < max_retries; ++attempt)
        {
            try
            {
                return func(std::forward<Args>(args)...);
            }
            catch (const std::exception &e)
            {
                if (attempt == max_retries - 1)
                {
                    Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_retries) +
                                  " attempts: " + e.what());
                    throw; // Re-throw on final attempt
                }

                int delay_ms = (1 << attempt) * 100; // Exponential backoff: 100ms, 200ms, 400ms...
                Logger::warn("Operation '" + operation_name + "' failed, retrying in " + std::to_string(delay_ms) +
                             "ms (attempt " + std::to_string(attempt + 1) + "/" + std::to_string(max_retries) +
                             "): " + e.what());

                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        }
        throw std::runtime_error("All retry attempts failed for operation: " + operation_name);
    }
};
