#pragma once

#include <atomic>
#include <memory>
#include <string>

/**
 * @brief Shared stop signal handed to every analyzer task of one run
 *
 * Copies share the same flag, so a task that outlives its run can still observe it.
 */
class CancellationToken
{
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel(const std::string &reason = "cancelled by caller")
    {
        bool expected = false;
        if (state_->cancelled.compare_exchange_strong(expected, true))
        {
            // reason is written once; readers only touch it after reason_ready is published
            state_->reason = reason;
            state_->reason_ready.store(true);
        }
    }

    bool isCancelled() const { return state_->cancelled.load(); }

    std::string reason() const
    {
        return state_->reason_ready.load() ? state_->reason : std::string();
    }

private:
    struct State
    {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> reason_ready{false};
        std::string reason;
    };
    std::shared_ptr<State> state_;
};
