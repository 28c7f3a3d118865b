// /////////////////////////////////////////////////////////////////////////////
/// @file ReplaySource.cpp
/// @brief ReplaySource implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/ReplaySource.hpp>

#include <charconv>
#include <chrono>
#include <fstream>
#include <string_view>

namespace btpad::input {

namespace {

template <typename T>
bool parseNumber(std::string_view text, T& out)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
        text.remove_suffix(1);

    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        text.remove_prefix(2);
        base = 16;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, base);
    return !text.empty() && ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

ReplaySource::ReplaySource(ReplayConfig config)
    : config_{std::move(config)}
{}

core::ExpectedVoid ReplaySource::open()
{
    if (opened_)
    {
        return core::makeError(core::ErrorCode::kAlreadyRunning,
            "ReplaySource already open");
    }

    auto loaded = load();
    if (!loaded)
    {
        return loaded;
    }

    cursor_ = 0;
    opened_ = true;
    return {};
}

core::Expected<mapping::RawEvent> ReplaySource::read()
{
    if (!opened_)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "ReplaySource not open");
    }

    std::unique_lock<std::mutex> lock{mutex_};
    if (config_.eventsPerSecond > 0.0 && cursor_ > 0)
    {
        const auto period = std::chrono::duration<core::f64>(1.0 / config_.eventsPerSecond);
        cv_.wait_for(lock, period, [this] { return cancelled_; });
    }
    if (cancelled_)
    {
        return core::makeError(core::ErrorCode::kCancelled, "ReplaySource read cancelled");
    }
    if (cursor_ >= events_.size())
    {
        return core::makeError(core::ErrorCode::kSourceDisconnected,
            "end of recording " + config_.filePath);
    }
    return events_[cursor_++];
}

void ReplaySource::cancel() noexcept
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        cancelled_ = true;
    }
    cv_.notify_all();
}

void ReplaySource::close() noexcept
{
    opened_ = false;
}

std::string ReplaySource::name() const
{
    return "replay (" + config_.filePath + ")";
}

core::usize ReplaySource::totalEvents() const noexcept
{
    return events_.size();
}

core::usize ReplaySource::cursor() const noexcept
{
    return cursor_;
}

core::ExpectedVoid ReplaySource::load()
{
    std::ifstream file(config_.filePath);
    if (!file.is_open())
    {
        return core::makeError(core::ErrorCode::kFileNotFound, config_.filePath);
    }

    events_.clear();
    std::string line;
    core::usize lineNumber = 0;

    while (std::getline(file, line))
    {
        ++lineNumber;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
            continue;

        const auto comma = line.find(',');
        mapping::RawEvent event;
        if (comma == std::string::npos ||
            !parseNumber(std::string_view{line}.substr(0, comma), event.code) ||
            !parseNumber(std::string_view{line}.substr(comma + 1), event.value))
        {
            return core::makeError(core::ErrorCode::kSourceReadError,
                config_.filePath + ":" + std::to_string(lineNumber) +
                ": expected 'code,value'");
        }
        events_.push_back(event);
    }

    return {};
}

} // namespace btpad::input
