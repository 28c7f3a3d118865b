// /////////////////////////////////////////////////////////////////////////////
/// @file RateMeter.hpp
/// @brief Measurement diagnostic: raw events per second over fixed windows.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventObserver.hpp>
#include <btpad/core/Types.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <vector>

namespace btpad::diag {

/// @brief Summary of a measurement run.
struct RateReport
{
    std::vector<core::f64> samples;   ///< events/s of each window, in order
    core::f64              max{0.0};
    core::f64              average{0.0}; ///< mean of the best half of the samples
};

// /////////////////////////////////////////////////////////////////////////////
/// @class RateMeter
/// @brief Counts raw events and records a rate each time a window fills.
///
/// The first window starts at construction. A window whose elapsed time
/// reads zero is discarded. Once @c windowCount samples are recorded the
/// meter is complete and ignores further events.
///
/// Events are counted on the producer thread; report() and complete() may
/// be called from any thread.
// /////////////////////////////////////////////////////////////////////////////
class RateMeter final : public input::IEventObserver
{
public:
    using Clock          = std::function<std::chrono::steady_clock::time_point()>;
    using WindowCallback = std::function<void(core::usize window, core::f64 eventsPerSecond)>;

    static constexpr core::usize kDefaultWindowSize  = 1000;
    static constexpr core::usize kDefaultWindowCount = 10;

    /// @param windowSize  Events per window, at least 1.
    /// @param windowCount Windows to record, at least 1.
    /// @param clock       Time source; steady_clock::now when empty.
    explicit RateMeter(core::usize windowSize = kDefaultWindowSize,
                       core::usize windowCount = kDefaultWindowCount,
                       Clock clock = {});

    /// @brief Called under no lock, on the counting thread, per window.
    void setWindowCallback(WindowCallback callback);

    void onRawEvent(const mapping::RawEvent& event) noexcept override;

    /// @brief Counts one event.
    void record();

    [[nodiscard]] RateReport report() const;
    [[nodiscard]] bool complete() const;

    [[nodiscard]] core::usize windowSize() const noexcept { return windowSize_; }
    [[nodiscard]] core::usize windowCount() const noexcept { return windowCount_; }

private:
    const core::usize                         windowSize_;
    const core::usize                         windowCount_;
    Clock                                     clock_;
    WindowCallback                            onWindow_;

    mutable std::mutex                        mutex_;
    std::chrono::steady_clock::time_point     windowStart_;
    core::usize                               count_{0};
    std::vector<core::f64>                    samples_;
};

} // namespace btpad::diag
