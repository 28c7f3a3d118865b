// /////////////////////////////////////////////////////////////////////////////
/// @file IEventObserver.hpp
/// @brief Hook into the controller's event pipeline.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/Event.hpp>

namespace btpad::input {

// /////////////////////////////////////////////////////////////////////////////
/// @class IEventObserver
/// @brief Receives every event the producer handles, on the producer thread.
///
/// onRawEvent() sees all events, mapped or not, before normalization;
/// onNormalized() sees mapped events after the state has been updated.
/// Implementations must be quick, thread-safe with respect to their own
/// readers, and must not throw. Controller::stop() may be called from
/// either hook.
// /////////////////////////////////////////////////////////////////////////////
class IEventObserver
{
public:
    virtual ~IEventObserver() = default;

    virtual void onRawEvent(const mapping::RawEvent& /*event*/) noexcept {}
    virtual void onNormalized(const mapping::NormalizedEvent& /*event*/) noexcept {}
};

} // namespace btpad::input
