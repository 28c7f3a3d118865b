// /////////////////////////////////////////////////////////////////////////////
/// @file ReplaySource.hpp
/// @brief Event source replaying a recorded "code,value" text file.
///
/// One event per line, code in decimal or 0x-hexadecimal; '#' comments and
/// blank lines are skipped. The end of the file is reported as
/// kSourceDisconnected, like a controller going out of range.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventSource.hpp>
#include <btpad/core/Types.hpp>

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace btpad::input {

/// @brief Configuration for a replay source.
struct ReplayConfig
{
    std::string filePath;
    core::f64   eventsPerSecond{0.0};   ///< 0 replays as fast as read() is called
};

class ReplaySource final : public IEventSource
{
public:
    explicit ReplaySource(ReplayConfig config);
    ~ReplaySource() override = default;

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<mapping::RawEvent> read() override;
    void cancel() noexcept override;
    void close() noexcept override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] core::usize totalEvents() const noexcept;
    [[nodiscard]] core::usize cursor() const noexcept;

private:
    [[nodiscard]] core::ExpectedVoid load();

    ReplayConfig                    config_;
    std::vector<mapping::RawEvent>  events_;
    core::usize                     cursor_{0};
    bool                            opened_{false};

    std::mutex                      mutex_;
    std::condition_variable         cv_;
    bool                            cancelled_{false};
};

} // namespace btpad::input
