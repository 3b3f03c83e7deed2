#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tf { class Executor; }

namespace tribe {

// External best-effort text/scoring service. Implementations may throw or
// block; callers never let either escape into the matching result.
class IScoringAdvisor
{
public:
    virtual ~IScoringAdvisor() = default;

    virtual std::string scoreText(const std::string& prompt) = 0;
};

// Runs advisor calls on a dedicated worker with a deadline. Every failure
// (exception, timeout, no advisor) collapses to std::nullopt and is logged.
//
// A timeout trips the gate: for the cooldown period every call returns
// std::nullopt at once, and calls still queued on the worker are dropped
// before reaching the advisor. At most kMaxInFlight calls are outstanding
// at any time. Destruction never waits for a stalled call.
class AdvisorGate
{
public:
    static constexpr int kMaxInFlight = 4;

    AdvisorGate(std::shared_ptr<IScoringAdvisor> advisor, std::chrono::milliseconds timeout,
                std::chrono::milliseconds cooldown = std::chrono::seconds(60));
    ~AdvisorGate();

    AdvisorGate(const AdvisorGate&) = delete;
    AdvisorGate& operator=(const AdvisorGate&) = delete;

    [[nodiscard]] bool enabled() const noexcept { return advisor_ != nullptr; }
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    [[nodiscard]] bool tripped() const noexcept;
    [[nodiscard]] int inFlight() const noexcept;

    [[nodiscard]] std::optional<std::string> ask(const std::string& prompt) const;

private:
    struct State;

    std::shared_ptr<IScoringAdvisor> advisor_;
    std::chrono::milliseconds        timeout_;
    std::chrono::milliseconds        cooldown_;
    std::shared_ptr<State>           state_;
    std::shared_ptr<tf::Executor>    executor_;
};

// "SCORE: 83" -> 83 (clamped to 0..100).
[[nodiscard]] std::optional<double> ParseAdvisorScore(const std::string& text);

} // namespace tribe
