#include "tribe/match/Advisor.hpp"

#include <taskflow/taskflow.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <future>
#include <regex>
#include <thread>

namespace tribe {

// Shared with queued calls, which may outlive the gate.
struct AdvisorGate::State
{
    using Clock = std::chrono::steady_clock;

    std::atomic<int>          inFlight{0};
    std::atomic<Clock::rep>   trippedUntil{0};

    bool tripped() const noexcept
    {
        return Clock::now().time_since_epoch().count() < trippedUntil.load();
    }

    void trip(std::chrono::milliseconds cooldown) noexcept
    {
        const auto until = Clock::now() + std::chrono::duration_cast<Clock::duration>(cooldown);
        trippedUntil.store(until.time_since_epoch().count());
    }
};

AdvisorGate::AdvisorGate(std::shared_ptr<IScoringAdvisor> advisor, std::chrono::milliseconds timeout,
                         std::chrono::milliseconds cooldown)
    : advisor_(std::move(advisor))
    , timeout_(timeout)
    , cooldown_(cooldown)
    , state_(std::make_shared<State>())
{
    if (advisor_)
        executor_ = std::make_shared<tf::Executor>(1);
}

AdvisorGate::~AdvisorGate()
{
    if (!executor_ || state_->inFlight.load() == 0)
        return;

    // A stalled call still holds the worker; the executor is released on a
    // detached thread once that call returns.
    spdlog::debug("advisor: releasing gate with {} call(s) outstanding", state_->inFlight.load());
    std::thread([executor = std::move(executor_)]() mutable { executor.reset(); }).detach();
}

bool AdvisorGate::tripped() const noexcept
{
    return state_->tripped();
}

int AdvisorGate::inFlight() const noexcept
{
    return state_->inFlight.load();
}

std::optional<std::string> AdvisorGate::ask(const std::string& prompt) const
{
    if (!advisor_ || state_->tripped())
        return std::nullopt;

    if (state_->inFlight.fetch_add(1) >= kMaxInFlight)
    {
        state_->inFlight.fetch_sub(1);
        spdlog::debug("advisor: {} calls outstanding, using algorithmic result", kMaxInFlight);
        return std::nullopt;
    }

    std::shared_ptr<IScoringAdvisor> advisor = advisor_;
    std::shared_ptr<State> state = state_;
    std::future<std::optional<std::string>> fut = executor_->async([advisor, state, prompt]() {
        struct Release
        {
            State& s;
            ~Release() { s.inFlight.fetch_sub(1); }
        } release{*state};

        if (state->tripped())
            return std::optional<std::string>{};
        return std::optional<std::string>{advisor->scoreText(prompt)};
    });

    if (fut.wait_for(timeout_) != std::future_status::ready)
    {
        state_->trip(cooldown_);
        spdlog::warn("advisor: no answer within {} ms, skipping the advisor for {} ms",
                     timeout_.count(), cooldown_.count());
        return std::nullopt;
    }

    try
    {
        return fut.get();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("advisor: call failed ({}), using algorithmic result", e.what());
    }
    catch (...)
    {
        spdlog::warn("advisor: call failed with a non-standard exception, using algorithmic result");
    }
    return std::nullopt;
}

std::optional<double> ParseAdvisorScore(const std::string& text)
{
    static const std::regex kScore(R"(SCORE:\s*(\d+(?:\.\d+)?))", std::regex::icase);

    std::smatch m;
    if (!std::regex_search(text, m, kScore))
        return std::nullopt;

    const std::string digits = m[1].str();
    const double v = std::strtod(digits.c_str(), nullptr);
    // Digit runs past the double range come back as HUGE_VAL.
    if (!std::isfinite(v))
        return 100.0;
    return std::clamp(v, 0.0, 100.0);
}

} // namespace tribe
