// /////////////////////////////////////////////////////////////////////////////
/// @file EventReader.cpp
/// @brief EventReader implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/EventReader.hpp>
#include <btpad/core/Assert.hpp>

namespace btpad::input {

EventReader::EventReader(std::unique_ptr<IEventSource> source, RunFlag& runFlag)
    : source_{std::move(source)}
    , runFlag_{runFlag}
{
    BTPAD_VERIFY(source_ != nullptr);
}

core::ExpectedVoid EventReader::open()
{
    if (terminated())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            source_->name() + ": reader already terminated");
    }
    return source_->open();
}

core::Expected<mapping::RawEvent> EventReader::next()
{
    if (terminated_.load(std::memory_order_acquire))
    {
        return core::makeError(core::ErrorCode::kSourceDisconnected,
            source_->name() + ": stream already ended");
    }

    auto event = source_->read();
    if (!event)
    {
        terminated_.store(true, std::memory_order_release);
        runFlag_.clear();
        return event;
    }

    event->sequence = eventsRead_.fetch_add(1, std::memory_order_relaxed);
    return event;
}

void EventReader::cancel() noexcept
{
    source_->cancel();
}

void EventReader::close() noexcept
{
    source_->close();
}

bool EventReader::terminated() const noexcept
{
    return terminated_.load(std::memory_order_acquire);
}

core::u64 EventReader::eventsRead() const noexcept
{
    return eventsRead_.load(std::memory_order_relaxed);
}

} // namespace btpad::input
