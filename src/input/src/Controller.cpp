// /////////////////////////////////////////////////////////////////////////////
/// @file Controller.cpp
/// @brief Controller implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/Controller.hpp>
#include <btpad/input/ControllerState.hpp>
#include <btpad/input/EventReader.hpp>
#include <btpad/input/RunFlag.hpp>
#include <btpad/mapping/Normalizer.hpp>
#include <btpad/core/Log.hpp>

#include <atomic>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace btpad::input {

namespace {

// Impl whose producer loop runs on this thread.
thread_local const void* tProducerOf = nullptr;

} // namespace

std::string_view lifecycleName(ControllerLifecycle lifecycle) noexcept
{
    switch (lifecycle)
    {
        case ControllerLifecycle::kConstructed: return "constructed";
        case ControllerLifecycle::kRunning:     return "running";
        case ControllerLifecycle::kStopped:     return "stopped";
    }
    return "unknown";
}

struct Controller::Impl
{
    Impl(std::shared_ptr<const mapping::MappingTable> mappingTable,
         std::unique_ptr<IEventSource> source,
         std::string logTag)
        : table{std::move(mappingTable)}
        , state{table}
        , reader{std::move(source), runFlag}
        , tag{std::move(logTag)}
    {}

    void producerLoop(std::stop_token stopToken);
    void recordError(const core::Error& error);
    void markStopped() noexcept;

    [[nodiscard]] bool onProducerThread() const noexcept { return tProducerOf == this; }

    std::shared_ptr<const mapping::MappingTable> table;
    RunFlag                                      runFlag;
    ControllerState                              state;
    EventReader                                  reader;
    std::string                                  tag;
    std::vector<IEventObserver*>                 observers;

    std::atomic<ControllerLifecycle>             lifecycle{ControllerLifecycle::kConstructed};
    std::mutex                                   controlMutex;
    bool                                         sourceClosed{false};
    std::jthread                                 worker;

    mutable std::mutex                           errorMutex;
    std::optional<core::Error>                   lastError;
};

void Controller::Impl::recordError(const core::Error& error)
{
    std::lock_guard lock{errorMutex};
    if (!lastError)
        lastError = error;
}

void Controller::Impl::markStopped() noexcept
{
    const auto previous = lifecycle.exchange(ControllerLifecycle::kStopped, std::memory_order_acq_rel);
    if (previous != ControllerLifecycle::kStopped)
        core::Log::info(tag, "stopped after " + std::to_string(reader.eventsRead()) + " events");
}

void Controller::Impl::producerLoop(std::stop_token stopToken)
{
    std::stop_callback onStop{stopToken, [this] { reader.cancel(); }};
    tProducerOf = this;

    while (!stopToken.stop_requested() && runFlag.isRunning())
    {
        auto event = reader.next();
        if (!event)
        {
            const auto& error = event.error();
            if (error.code() == core::ErrorCode::kCancelled)
            {
                core::Log::debug(tag, "reader cancelled");
            }
            else
            {
                core::Log::warn(tag, "event stream ended: " + error.format());
                recordError(error);
            }
            break;
        }

        for (auto* observer : observers)
            observer->onRawEvent(*event);

        const auto normalized = mapping::normalize(*event, *table);
        if (!normalized)
            continue;

        state.apply(normalized->slot, normalized->value);

        for (auto* observer : observers)
            observer->onNormalized(*normalized);
    }

    tProducerOf = nullptr;
    runFlag.clear();
    lifecycle.store(ControllerLifecycle::kStopped, std::memory_order_release);
}

Controller::Controller(std::shared_ptr<Impl> impl)
    : impl_{std::move(impl)}
{}

Controller::~Controller()
{
    stop();

    // Released from an observer: the producer keeps its own reference to
    // the Impl and finishes on its own.
    if (impl_->onProducerThread())
        impl_->worker.detach();
}

core::Expected<std::unique_ptr<Controller>> Controller::create(
    std::unique_ptr<IEventSource> source,
    const ControllerOptions& options)
{
    if (!source)
        return core::makeError(core::ErrorCode::kInvalidArgument, "controller needs an event source");

    auto table = options.mapping()
        ? mapping::MappingTable::load(*options.mapping())
        : mapping::MappingTable::forFamily(options.family());
    if (!table)
    {
        core::Log::error(options.logTag(), "invalid mapping: " + table.error().format());
        return std::unexpected(std::move(table.error()));
    }

    auto shared = std::make_shared<const mapping::MappingTable>(std::move(*table));
    core::Log::debug(options.logTag(),
        source->name() + ": " + std::to_string(shared->size()) + " codes mapped onto "
        + std::to_string(shared->controlCount()) + " controls");

    auto impl = std::make_shared<Impl>(std::move(shared), std::move(source), options.logTag());
    return std::unique_ptr<Controller>(new Controller(std::move(impl)));
}

core::ExpectedVoid Controller::addObserver(IEventObserver* observer)
{
    if (observer == nullptr)
        return core::makeError(core::ErrorCode::kInvalidArgument, "observer is null");

    std::lock_guard lock{impl_->controlMutex};
    if (impl_->lifecycle.load(std::memory_order_acquire) != ControllerLifecycle::kConstructed)
        return core::makeError(core::ErrorCode::kInvalidState, "observers must be attached before start()");

    impl_->observers.push_back(observer);
    return {};
}

core::ExpectedVoid Controller::start()
{
    std::lock_guard lock{impl_->controlMutex};

    const auto current = impl_->lifecycle.load(std::memory_order_acquire);
    if (current != ControllerLifecycle::kConstructed)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            std::string{"cannot start a controller that is "} + std::string{lifecycleName(current)});
    }

    auto opened = impl_->reader.open();
    if (!opened)
    {
        core::Log::error(impl_->tag, "open failed: " + opened.error().format());
        impl_->recordError(opened.error());
        impl_->lifecycle.store(ControllerLifecycle::kStopped, std::memory_order_release);
        return opened;
    }

    impl_->runFlag.set();
    impl_->lifecycle.store(ControllerLifecycle::kRunning, std::memory_order_release);
    impl_->worker = std::jthread([impl = impl_](std::stop_token st) { impl->producerLoop(st); });

    core::Log::info(impl_->tag, "started on " + impl_->reader.source().name());
    return {};
}

void Controller::stop() noexcept
{
    if (impl_->onProducerThread())
    {
        impl_->runFlag.clear();
        impl_->markStopped();
        return;
    }

    std::lock_guard lock{impl_->controlMutex};

    if (impl_->worker.joinable())
    {
        impl_->worker.request_stop();
        impl_->worker.join();
    }

    if (!impl_->sourceClosed)
    {
        impl_->reader.close();
        impl_->sourceClosed = true;
    }

    impl_->runFlag.clear();
    impl_->markStopped();
}

PollResult Controller::poll() const noexcept
{
    const bool running = impl_->lifecycle.load(std::memory_order_acquire) == ControllerLifecycle::kRunning
        && impl_->runFlag.isRunning();
    return PollResult{impl_->state.snapshot(), running};
}

ControllerLifecycle Controller::lifecycle() const noexcept
{
    return impl_->lifecycle.load(std::memory_order_acquire);
}

std::optional<core::Error> Controller::lastError() const
{
    std::lock_guard lock{impl_->errorMutex};
    return impl_->lastError;
}

const mapping::MappingTable& Controller::mapping() const noexcept
{
    return *impl_->table;
}

core::u64 Controller::eventsRead() const noexcept
{
    return impl_->reader.eventsRead();
}

} // namespace btpad::input
