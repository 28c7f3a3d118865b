// /////////////////////////////////////////////////////////////////////////////
/// @file QueueSource.cpp
/// @brief QueueSource implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/QueueSource.hpp>

namespace btpad::input {

QueueSource::QueueSource(std::string label)
    : label_{std::move(label)}
{}

void QueueSource::push(core::u32 code, core::i32 value)
{
    push(mapping::RawEvent{code, value, 0});
}

void QueueSource::push(const mapping::RawEvent& event)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        queue_.push_back(event);
    }
    cv_.notify_one();
}

void QueueSource::disconnect()
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        disconnected_ = true;
    }
    cv_.notify_all();
}

void QueueSource::fail(std::string reason)
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        failure_ = std::move(reason);
    }
    cv_.notify_all();
}

core::usize QueueSource::pending() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return queue_.size();
}

core::ExpectedVoid QueueSource::open()
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (opened_)
    {
        return core::makeError(core::ErrorCode::kAlreadyRunning, label_ + ": already open");
    }
    opened_ = true;
    return {};
}

core::Expected<mapping::RawEvent> QueueSource::read()
{
    std::unique_lock<std::mutex> lock{mutex_};
    if (!opened_)
    {
        return core::makeError(core::ErrorCode::kInvalidState, label_ + ": not open");
    }

    cv_.wait(lock, [this] {
        return cancelled_ || !queue_.empty() || disconnected_ || failure_.has_value();
    });

    if (cancelled_)
    {
        return core::makeError(core::ErrorCode::kCancelled, label_ + ": read cancelled");
    }
    if (!queue_.empty())
    {
        const mapping::RawEvent event = queue_.front();
        queue_.pop_front();
        return event;
    }
    if (failure_)
    {
        return core::makeError(core::ErrorCode::kSourceReadError, label_ + ": " + *failure_);
    }
    return core::makeError(core::ErrorCode::kSourceDisconnected, label_ + ": disconnected");
}

void QueueSource::cancel() noexcept
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        cancelled_ = true;
    }
    cv_.notify_all();
}

void QueueSource::close() noexcept
{
    std::lock_guard<std::mutex> lock{mutex_};
    opened_ = false;
}

std::string QueueSource::name() const
{
    return label_;
}

} // namespace btpad::input
