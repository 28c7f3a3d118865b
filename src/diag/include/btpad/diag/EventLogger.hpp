// /////////////////////////////////////////////////////////////////////////////
/// @file EventLogger.hpp
/// @brief Pass-through diagnostic: one line per normalized event.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/IEventObserver.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace btpad::diag {

// /////////////////////////////////////////////////////////////////////////////
/// @class EventLogger
/// @brief Writes "button: NAME, value: V" for every normalized event.
///
/// Lines go to the supplied sink, or through core::Log (tag "padmon") when
/// none is given. With @c logRaw every raw event is also logged at debug
/// level, mapped or not, which helps writing a mapping file for an
/// unknown controller.
// /////////////////////////////////////////////////////////////////////////////
class EventLogger final : public input::IEventObserver
{
public:
    using Sink = std::function<void(std::string_view line)>;

    explicit EventLogger(Sink sink = {}, bool logRaw = false);

    void onRawEvent(const mapping::RawEvent& event) noexcept override;
    void onNormalized(const mapping::NormalizedEvent& event) noexcept override;

    [[nodiscard]] static std::string formatEvent(const mapping::NormalizedEvent& event);
    [[nodiscard]] static std::string formatRaw(const mapping::RawEvent& event);

private:
    void emit(const std::string& line) noexcept;

    Sink sink_;
    bool logRaw_{false};
};

} // namespace btpad::diag
