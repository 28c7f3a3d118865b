// /////////////////////////////////////////////////////////////////////////////
/// @file QueueSource.hpp
/// @brief In-memory blocking event source.
///
/// For applications that already own a device stack (and hand events over
/// one by one) and for tests. push(), disconnect() and fail() are
/// thread-safe; read() drains every queued event before reporting the end
/// of the stream.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventSource.hpp>
#include <btpad/core/Types.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace btpad::input {

class QueueSource final : public IEventSource
{
public:
    explicit QueueSource(std::string label = "queue");
    ~QueueSource() override = default;

    /// @brief Enqueues one event and wakes the reader.
    void push(core::u32 code, core::i32 value);
    void push(const mapping::RawEvent& event);

    /// @brief Ends the stream once the queue is drained.
    void disconnect();

    /// @brief Ends the stream with kSourceReadError once the queue is drained.
    void fail(std::string reason);

    /// @brief Number of events not yet read.
    [[nodiscard]] core::usize pending() const;

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<mapping::RawEvent> read() override;
    void cancel() noexcept override;
    void close() noexcept override;
    [[nodiscard]] std::string name() const override;

private:
    std::string                     label_;
    mutable std::mutex              mutex_;
    std::condition_variable         cv_;
    std::deque<mapping::RawEvent>   queue_;
    std::optional<std::string>      failure_;
    bool                            opened_{false};
    bool                            disconnected_{false};
    bool                            cancelled_{false};
};

} // namespace btpad::input
