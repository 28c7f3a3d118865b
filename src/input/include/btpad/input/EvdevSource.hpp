// /////////////////////////////////////////////////////////////////////////////
/// @file EvdevSource.hpp
/// @brief Event source reading a Linux input event device.
///
/// Reads `struct input_event` records from /dev/input/eventN (or from any
/// descriptor carrying the same records) and forwards EV_KEY and EV_ABS
/// events; synchronisation and misc records are dropped here. Blocking is
/// done with poll(2) on the device and an eventfd(2) that cancel() signals.
///
/// After SYN_DROPPED the records up to the next SYN_REPORT are discarded and
/// the key and axis state is read back with EVIOCGKEY/EVIOCGABS; a change
/// from what was last forwarded is emitted as an ordinary event. A
/// descriptor that cannot be queried gets a release for every held key.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventSource.hpp>
#include <btpad/core/Platform.hpp>

#include <memory>
#include <string>

#ifdef BTPAD_OS_LINUX

namespace btpad::input {

class EvdevSource final : public IEventSource
{
public:
    /// @param devicePath Event device to open read-only.
    explicit EvdevSource(std::string devicePath);

    /// @brief Wraps an already-open descriptor, e.g. one handed over by
    ///        the process that paired the controller. Ownership of @p fd is
    ///        transferred.
    [[nodiscard]] static std::unique_ptr<EvdevSource> adopt(int fd, std::string label);

    ~EvdevSource() override;

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<mapping::RawEvent> read() override;
    void cancel() noexcept override;
    void close() noexcept override;
    [[nodiscard]] std::string name() const override;

    /// @brief Device name reported by EVIOCGNAME, empty if unavailable.
    [[nodiscard]] std::string deviceName() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace btpad::input

#endif // BTPAD_OS_LINUX
