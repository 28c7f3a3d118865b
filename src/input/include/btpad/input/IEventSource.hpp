// /////////////////////////////////////////////////////////////////////////////
/// @file IEventSource.hpp
/// @brief Abstract blocking source of raw controller events.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/Event.hpp>
#include <btpad/core/Expected.hpp>

#include <string>

namespace btpad::input {

// /////////////////////////////////////////////////////////////////////////////
/// @class IEventSource
/// @brief Strategy interface over whatever delivers (code, value) pairs:
///        a Linux event device, an in-memory queue, a recording.
///
/// Contract:
/// 1. open() acquires the underlying handle. Must be called before read().
/// 2. read() blocks until the next event and returns events in exactly the
///    order the driver produced them. End of stream is
///    ErrorCode::kSourceDisconnected, a failed read kSourceReadError.
/// 3. cancel() may be called from any thread; it wakes a blocked read(),
///    which then returns kCancelled, as does every later read().
/// 4. close() releases the handle. It is only called once no read() is in
///    flight.
// /////////////////////////////////////////////////////////////////////////////
class IEventSource
{
public:
    virtual ~IEventSource() = default;

    IEventSource(const IEventSource&) = delete;
    IEventSource& operator=(const IEventSource&) = delete;

    [[nodiscard]] virtual core::ExpectedVoid open() = 0;

    [[nodiscard]] virtual core::Expected<mapping::RawEvent> read() = 0;

    virtual void cancel() noexcept = 0;

    virtual void close() noexcept = 0;

    /// @brief Human-readable description, used in log messages.
    [[nodiscard]] virtual std::string name() const = 0;

protected:
    IEventSource() = default;
};

} // namespace btpad::input
