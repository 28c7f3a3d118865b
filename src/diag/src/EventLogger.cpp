// /////////////////////////////////////////////////////////////////////////////
/// @file EventLogger.cpp
/// @brief EventLogger implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/diag/EventLogger.hpp>
#include <btpad/core/Log.hpp>

#include <exception>
#include <ios>
#include <sstream>
#include <utility>

namespace btpad::diag {

namespace {

constexpr std::string_view kTag = "padmon";

} // namespace

EventLogger::EventLogger(Sink sink, bool logRaw)
    : sink_{std::move(sink)}
    , logRaw_{logRaw}
{}

std::string EventLogger::formatEvent(const mapping::NormalizedEvent& event)
{
    std::ostringstream os;
    os << "button: " << event.name << ", value: " << event.value;
    return os.str();
}

std::string EventLogger::formatRaw(const mapping::RawEvent& event)
{
    std::ostringstream os;
    os << "raw #" << event.sequence << ": code 0x" << std::hex << event.code
       << std::dec << ", value " << event.value;
    return os.str();
}

void EventLogger::onRawEvent(const mapping::RawEvent& event) noexcept
{
    if (!logRaw_ || core::Log::minLevel() > core::LogLevel::kDebug)
        return;

    try
    {
        core::Log::debug(kTag, formatRaw(event));
    }
    catch (const std::exception& e)
    {
        core::Log::error(kTag, e.what());
    }
}

void EventLogger::onNormalized(const mapping::NormalizedEvent& event) noexcept
{
    try
    {
        emit(formatEvent(event));
    }
    catch (const std::exception& e)
    {
        core::Log::error(kTag, e.what());
    }
}

void EventLogger::emit(const std::string& line) noexcept
{
    if (!sink_)
    {
        core::Log::info(kTag, line);
        return;
    }

    try
    {
        sink_(line);
    }
    catch (const std::exception& e)
    {
        core::Log::error(kTag, std::string{"event sink failed: "} + e.what());
    }
}

} // namespace btpad::diag
