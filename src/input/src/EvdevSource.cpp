// /////////////////////////////////////////////////////////////////////////////
/// @file EvdevSource.cpp
/// @brief Linux implementation of the event device source.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/EvdevSource.hpp>
#include <btpad/core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace btpad::input {

namespace {

constexpr std::size_t kBatchEvents = 64;
constexpr std::string_view kTag = "evdev";

template <std::size_t N>
bool testBit(const std::array<unsigned char, N>& bits, unsigned bit) noexcept
{
    return (bits[bit / 8] >> (bit % 8)) & 1u;
}

core::Unexpected readFailure(const char* what, int err)
{
    if (err == ENODEV)
        return core::makeError(core::ErrorCode::kSourceDisconnected,
            std::string(what) + ": " + std::strerror(err));
    return core::makeError(core::ErrorCode::kSourceReadError,
        std::string(what) + ": " + std::strerror(err));
}

} // namespace

struct EvdevSource::Impl
{
    std::string                            path;
    int                                    fd{-1};
    int                                    wakeFd{-1};
    int                                    wakeError{0};
    bool                                   adopted{false};
    std::atomic<bool>                      cancelled{false};
    std::array<input_event, kBatchEvents>  batch{};
    std::size_t                            head{0};
    std::size_t                            count{0};

    /// Set by SYN_DROPPED, cleared by the next SYN_REPORT.
    bool                                   dropping{false};
    std::deque<mapping::RawEvent>          resync;
    std::unordered_map<core::u16, core::i32> keys;
    std::unordered_map<core::u16, core::i32> axes;

    std::optional<mapping::RawEvent> accept(const input_event& ev);
    void resynchronise();
};

std::optional<mapping::RawEvent> EvdevSource::Impl::accept(const input_event& ev)
{
    if (ev.type == EV_SYN)
    {
        if (ev.code == SYN_DROPPED)
        {
            dropping = true;
        }
        else if (ev.code == SYN_REPORT && dropping)
        {
            dropping = false;
            resynchronise();
        }
        return std::nullopt;
    }
    if (dropping)
        return std::nullopt;

    if (ev.type == EV_KEY)
        keys[ev.code] = ev.value;
    else if (ev.type == EV_ABS)
        axes[ev.code] = ev.value;
    else
        return std::nullopt;
    return mapping::RawEvent{ev.code, ev.value, 0};
}

// Queues one event per key or axis whose device state differs from what was
// last forwarded. When the device cannot be queried, every key still held
// is released.
void EvdevSource::Impl::resynchronise()
{
    auto queue = [this](std::unordered_map<core::u16, core::i32>& known, core::u16 code, core::i32 value) {
        const auto it = known.find(code);
        if (it != known.end() && it->second == value)
            return;
        known[code] = value;
        resync.push_back(mapping::RawEvent{code, value, 0});
    };

    std::array<unsigned char, KEY_MAX / 8 + 1> keyState{};
    if (::ioctl(fd, EVIOCGKEY(keyState.size()), keyState.data()) >= 0)
    {
        for (unsigned code = 0; code <= KEY_MAX; ++code)
        {
            const core::i32 pressed = testBit(keyState, code) ? 1 : 0;
            const auto it = keys.find(static_cast<core::u16>(code));
            if (pressed != 0 || (it != keys.end() && it->second != 0))
                queue(keys, static_cast<core::u16>(code), pressed);
        }

        std::array<unsigned char, ABS_MAX / 8 + 1> absBits{};
        if (::ioctl(fd, EVIOCGBIT(EV_ABS, absBits.size()), absBits.data()) >= 0)
        {
            for (unsigned code = 0; code <= ABS_MAX; ++code)
            {
                input_absinfo info{};
                if (testBit(absBits, code) && ::ioctl(fd, EVIOCGABS(code), &info) >= 0)
                    queue(axes, static_cast<core::u16>(code), info.value);
            }
        }
        core::Log::warn(kTag, path + ": events dropped, resynchronised " +
                              std::to_string(resync.size()) + " controls from the device");
        return;
    }

    for (const auto& [code, value] : keys)
    {
        if (value != 0)
            resync.push_back(mapping::RawEvent{code, 0, 0});
    }
    for (const auto& event : resync)
        keys[static_cast<core::u16>(event.code)] = 0;
    core::Log::warn(kTag, path + ": events dropped and device state unavailable, released " +
                          std::to_string(resync.size()) + " keys");
}

EvdevSource::EvdevSource(std::string devicePath)
    : impl_{std::make_unique<Impl>()}
{
    impl_->path   = std::move(devicePath);
    impl_->wakeFd = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (impl_->wakeFd < 0)
        impl_->wakeError = errno;
}

std::unique_ptr<EvdevSource> EvdevSource::adopt(int fd, std::string label)
{
    auto source = std::make_unique<EvdevSource>(std::move(label));
    source->impl_->fd      = fd;
    source->impl_->adopted = true;
    return source;
}

EvdevSource::~EvdevSource()
{
    close();
    if (impl_->wakeFd >= 0)
    {
        ::close(impl_->wakeFd);
        impl_->wakeFd = -1;
    }
}

core::ExpectedVoid EvdevSource::open()
{
    if (impl_->wakeFd < 0)
    {
        return core::makeError(core::ErrorCode::kDeviceOpenFailed,
            std::string("eventfd: ") + std::strerror(impl_->wakeError));
    }
    if (impl_->adopted)
    {
        if (impl_->fd < 0)
            return core::makeError(core::ErrorCode::kInvalidState,
                impl_->path + ": adopted descriptor already closed");
        return {};
    }
    if (impl_->fd >= 0)
    {
        return core::makeError(core::ErrorCode::kAlreadyRunning,
            impl_->path + ": already open");
    }

    impl_->fd = ::open(impl_->path.c_str(), O_RDONLY | O_CLOEXEC);
    if (impl_->fd < 0)
    {
        return core::makeError(core::ErrorCode::kDeviceOpenFailed,
            impl_->path + ": " + std::strerror(errno));
    }
    return {};
}

core::Expected<mapping::RawEvent> EvdevSource::read()
{
    if (impl_->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, impl_->path + ": not open");
    }

    for (;;)
    {
        if (impl_->cancelled.load(std::memory_order_acquire))
            return core::makeError(core::ErrorCode::kCancelled, impl_->path + ": read cancelled");

        while (impl_->resync.empty() && impl_->head < impl_->count)
        {
            if (auto event = impl_->accept(impl_->batch[impl_->head++]))
                return *event;
        }
        if (!impl_->resync.empty())
        {
            const auto event = impl_->resync.front();
            impl_->resync.pop_front();
            return event;
        }

        std::array<pollfd, 2> fds{{
            {impl_->fd, POLLIN, 0},
            {impl_->wakeFd, POLLIN, 0},
        }};
        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            return readFailure("poll", errno);
        }
        if (fds[1].revents & POLLIN)
            continue;

        const auto bytes = ::read(impl_->fd, impl_->batch.data(),
                                  impl_->batch.size() * sizeof(input_event));
        if (bytes < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return readFailure(impl_->path.c_str(), errno);
        }
        if (bytes == 0)
        {
            return core::makeError(core::ErrorCode::kSourceDisconnected,
                impl_->path + ": end of stream");
        }
        if (static_cast<std::size_t>(bytes) % sizeof(input_event) != 0)
        {
            return core::makeError(core::ErrorCode::kSourceReadError,
                impl_->path + ": truncated input_event record");
        }

        impl_->head  = 0;
        impl_->count = static_cast<std::size_t>(bytes) / sizeof(input_event);
    }
}

void EvdevSource::cancel() noexcept
{
    impl_->cancelled.store(true, std::memory_order_release);
    if (impl_->wakeFd >= 0)
    {
        const std::uint64_t one = 1;
        [[maybe_unused]] const auto written = ::write(impl_->wakeFd, &one, sizeof(one));
    }
}

void EvdevSource::close() noexcept
{
    if (impl_->fd >= 0)
    {
        ::close(impl_->fd);
        impl_->fd = -1;
    }
    impl_->head     = 0;
    impl_->count    = 0;
    impl_->dropping = false;
    impl_->resync.clear();
    impl_->keys.clear();
    impl_->axes.clear();
}

std::string EvdevSource::name() const
{
    return "evdev (" + impl_->path + ")";
}

std::string EvdevSource::deviceName() const
{
    if (impl_->fd < 0)
        return {};

    char buffer[256] = {};
    if (::ioctl(impl_->fd, EVIOCGNAME(sizeof(buffer) - 1), buffer) < 0)
        return {};
    return std::string(buffer);
}

} // namespace btpad::input
