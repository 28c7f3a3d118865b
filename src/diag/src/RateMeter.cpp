// /////////////////////////////////////////////////////////////////////////////
/// @file RateMeter.cpp
/// @brief RateMeter implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/diag/RateMeter.hpp>
#include <btpad/core/Log.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <numeric>
#include <optional>
#include <utility>

namespace btpad::diag {

RateMeter::RateMeter(core::usize windowSize, core::usize windowCount, Clock clock)
    : windowSize_{std::max<core::usize>(windowSize, 1)}
    , windowCount_{std::max<core::usize>(windowCount, 1)}
    , clock_{clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }}}
{
    samples_.reserve(windowCount_);
    windowStart_ = clock_();
}

void RateMeter::setWindowCallback(WindowCallback callback)
{
    std::lock_guard lock{mutex_};
    onWindow_ = std::move(callback);
}

void RateMeter::onRawEvent(const mapping::RawEvent& /*event*/) noexcept
{
    try
    {
        record();
    }
    catch (const std::exception& e)
    {
        core::Log::error("padmon", e.what());
    }
}

void RateMeter::record()
{
    std::optional<std::pair<core::usize, core::f64>> finished;
    WindowCallback callback;

    {
        std::lock_guard lock{mutex_};
        if (samples_.size() >= windowCount_)
            return;

        if (++count_ < windowSize_)
            return;

        const auto now = clock_();
        const std::chrono::duration<core::f64> elapsed = now - windowStart_;
        const auto events = count_;
        count_       = 0;
        windowStart_ = now;

        if (elapsed.count() <= 0.0)
            return;

        const core::f64 rate = static_cast<core::f64>(events) / elapsed.count();
        samples_.push_back(rate);
        finished = std::make_pair(samples_.size() - 1, rate);
        callback = onWindow_;
    }

    if (finished && callback)
        callback(finished->first, finished->second);
}

RateReport RateMeter::report() const
{
    RateReport result;
    {
        std::lock_guard lock{mutex_};
        result.samples = samples_;
    }

    if (result.samples.empty())
        return result;

    std::vector<core::f64> sorted = result.samples;
    std::sort(sorted.begin(), sorted.end());

    const auto best = sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 2);
    result.max     = sorted.back();
    result.average = std::accumulate(best, sorted.end(), 0.0)
                   / static_cast<core::f64>(sorted.end() - best);
    return result;
}

bool RateMeter::complete() const
{
    std::lock_guard lock{mutex_};
    return samples_.size() >= windowCount_;
}

} // namespace btpad::diag
