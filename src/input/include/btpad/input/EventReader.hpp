// /////////////////////////////////////////////////////////////////////////////
/// @file EventReader.hpp
/// @brief Sequential reader over an event source, with terminal latching.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventSource.hpp>
#include <btpad/input/RunFlag.hpp>
#include <btpad/core/Expected.hpp>
#include <btpad/core/NonCopyable.hpp>
#include <btpad/core/Types.hpp>

#include <atomic>
#include <memory>

namespace btpad::input {

// /////////////////////////////////////////////////////////////////////////////
/// @class EventReader
/// @brief Owns the source and yields its events one at a time, in order.
///
/// The first error ends the stream for good: the run flag is cleared and
/// every later next() returns kSourceDisconnected without touching the
/// source. There is no retry; reconnecting is the caller's business.
///
/// next() must only be called from one thread (the producer); cancel() and
/// the counters are safe from any thread.
// /////////////////////////////////////////////////////////////////////////////
class EventReader final : public core::NonMovable<EventReader>
{
public:
    EventReader(std::unique_ptr<IEventSource> source, RunFlag& runFlag);

    [[nodiscard]] core::ExpectedVoid open();

    /// @brief Blocks for the next event; stamps its arrival sequence.
    [[nodiscard]] core::Expected<mapping::RawEvent> next();

    /// @brief Wakes a blocked next().
    void cancel() noexcept;

    /// @brief Releases the source. No next() may be in flight.
    void close() noexcept;

    [[nodiscard]] bool terminated() const noexcept;
    [[nodiscard]] core::u64 eventsRead() const noexcept;
    [[nodiscard]] const IEventSource& source() const noexcept { return *source_; }

private:
    std::unique_ptr<IEventSource> source_;
    RunFlag&                      runFlag_;
    std::atomic<core::u64>        eventsRead_{0};
    std::atomic<bool>             terminated_{false};
};

} // namespace btpad::input
