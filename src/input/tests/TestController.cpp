/**
 * @file TestController.cpp
 * @brief Unit tests for btpad::input::Controller.
 */

#include <catch2/catch_test_macros.hpp>

#include "btpad/input/Controller.hpp"
#include "btpad/input/QueueSource.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace btpad::input {

namespace {

using Step = mapping::NormalizationStep;

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::seconds(2))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

mapping::MappingConfig scenarioMapping()
{
    return mapping::MappingConfig{}
        .button(0x130, "A")
        .axis(0x03, "LEFT_STICK_Y", {Step::scale(-32768, 32767), Step::deadzone(2000)});
}

struct Fixture
{
    QueueSource*                source{nullptr};
    std::unique_ptr<Controller> controller;
};

Fixture makeController(const ControllerOptions& options)
{
    auto queue = std::make_unique<QueueSource>("test-pad");
    Fixture fixture;
    fixture.source = queue.get();

    auto created = Controller::create(std::move(queue), options);
    REQUIRE(created.has_value());
    fixture.controller = std::move(*created);
    return fixture;
}

Fixture makeScenarioController()
{
    return makeController(ControllerOptions::Builder{}.mapping(scenarioMapping()).build());
}

class RecordingObserver final : public IEventObserver
{
public:
    void onRawEvent(const mapping::RawEvent& event) noexcept override
    {
        std::lock_guard lock{mutex_};
        raw_.push_back(event.code);
    }

    void onNormalized(const mapping::NormalizedEvent& event) noexcept override
    {
        std::lock_guard lock{mutex_};
        normalized_.emplace_back(event.name);
    }

    [[nodiscard]] std::vector<core::u32> raw() const
    {
        std::lock_guard lock{mutex_};
        return raw_;
    }

    [[nodiscard]] std::vector<std::string> normalized() const
    {
        std::lock_guard lock{mutex_};
        return normalized_;
    }

private:
    mutable std::mutex       mutex_;
    std::vector<core::u32>   raw_;
    std::vector<std::string> normalized_;
};

/// Stops the controller from inside the pipeline on the first press.
class StopOnPress final : public IEventObserver
{
public:
    void onNormalized(const mapping::NormalizedEvent& event) noexcept override
    {
        if (event.value == 1.0)
        {
            controller->stop();
            stopped.store(true);
        }
    }

    Controller*       controller{nullptr};
    std::atomic<bool> stopped{false};
};

/// Drops the last owner of the controller from inside the pipeline.
class ReleaseOnPress final : public IEventObserver
{
public:
    void onNormalized(const mapping::NormalizedEvent& event) noexcept override
    {
        if (event.value == 1.0)
        {
            controller.reset();
            released.store(true);
        }
    }

    std::unique_ptr<Controller> controller;
    std::atomic<bool>           released{false};
};

} // namespace

TEST_CASE("Controller follows the press, release and noise scenario", "[input][controller][scenario]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;
    REQUIRE(controller->start().has_value());

    source->push(0x130, 1);
    REQUIRE(waitUntil([&] { return controller->poll().state->valueOr("A") == 1.0; }));

    source->push(0x130, 0);
    REQUIRE(waitUntil([&] { return controller->poll().state->valueOr("A") == 0.0; }));

    source->push(0x03, 100);
    REQUIRE(waitUntil([&] { return controller->eventsRead() == 3; }));

    auto result = controller->poll();
    REQUIRE(result.running);
    REQUIRE(result.state->value("A") == 0.0);
    REQUIRE(result.state->value("LEFT_STICK_Y") == 0.0);
    REQUIRE(result.state->sequence() == 2);
}

TEST_CASE("Controller keeps the last snapshot after disconnection", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;
    REQUIRE(controller->start().has_value());

    source->push(0x130, 1);
    source->push(0x03, -32768);
    source->disconnect();

    REQUIRE(waitUntil([&] { return !controller->poll().running; }));

    auto last = controller->poll();
    REQUIRE_FALSE(last.running);
    REQUIRE(last.state->value("A") == 1.0);
    REQUIRE(last.state->value("LEFT_STICK_Y") == -1.0);

    source->push(0x130, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    for (int i = 0; i < 10; ++i)
    {
        auto again = controller->poll();
        REQUIRE_FALSE(again.running);
        REQUIRE(again.state == last.state);
    }

    REQUIRE(controller->lifecycle() == ControllerLifecycle::kStopped);
    auto error = controller->lastError();
    REQUIRE(error.has_value());
    REQUIRE(error->code() == core::ErrorCode::kSourceDisconnected);
}

TEST_CASE("Controller stops on a read failure", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;
    REQUIRE(controller->start().has_value());

    source->fail("adapter unplugged");
    REQUIRE(waitUntil([&] { return !controller->poll().running; }));
    REQUIRE(controller->lastError()->code() == core::ErrorCode::kSourceReadError);
}

TEST_CASE("Controller stop unblocks the producer and is terminal", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto& controller = fixture.controller;
    REQUIRE(controller->start().has_value());
    REQUIRE(controller->poll().running);

    controller->stop();
    REQUIRE(controller->lifecycle() == ControllerLifecycle::kStopped);
    REQUIRE_FALSE(controller->poll().running);
    REQUIRE_FALSE(controller->lastError().has_value());

    controller->stop();

    auto restart = controller->start();
    REQUIRE_FALSE(restart.has_value());
    REQUIRE(restart.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("Controller can be stopped by one of its observers", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;

    StopOnPress observer;
    observer.controller = controller.get();
    REQUIRE(controller->addObserver(&observer).has_value());
    REQUIRE(controller->start().has_value());

    source->push(0x130, 1);
    source->push(0x03, 32767);
    REQUIRE(waitUntil([&] { return !controller->poll().running; }));

    REQUIRE(observer.stopped.load());
    REQUIRE(controller->lifecycle() == ControllerLifecycle::kStopped);
    REQUIRE(controller->poll().state->value("A") == 1.0);

    controller->stop();
    REQUIRE(controller->eventsRead() == 1);
    REQUIRE(controller->poll().state->value("LEFT_STICK_Y") == 0.0);
}

TEST_CASE("Controller can be destroyed by one of its observers", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;

    ReleaseOnPress observer;
    REQUIRE(fixture.controller->addObserver(&observer).has_value());
    REQUIRE(fixture.controller->start().has_value());
    observer.controller = std::move(fixture.controller);

    source->push(0x130, 1);
    REQUIRE(waitUntil([&] { return observer.released.load(); }));
    REQUIRE(observer.controller == nullptr);
}

TEST_CASE("Controller enforces its lifecycle", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto& controller = fixture.controller;

    auto idle = controller->poll();
    REQUIRE_FALSE(idle.running);
    REQUIRE(idle.state->sequence() == 0);
    REQUIRE(controller->lifecycle() == ControllerLifecycle::kConstructed);

    REQUIRE(controller->start().has_value());
    auto twice = controller->start();
    REQUIRE_FALSE(twice.has_value());
    REQUIRE(twice.error().code() == core::ErrorCode::kInvalidState);

    RecordingObserver observer;
    auto late = controller->addObserver(&observer);
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("Controller ignores unmapped codes", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;
    REQUIRE(controller->start().has_value());

    auto before = controller->poll().state;
    source->push(0x13b, 1);
    source->push(0x28, 7);
    REQUIRE(waitUntil([&] { return controller->eventsRead() == 2; }));

    REQUIRE(controller->poll().state == before);
}

TEST_CASE("Controller feeds observers raw and normalized events", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;

    RecordingObserver observer;
    REQUIRE(controller->addObserver(&observer).has_value());
    REQUIRE_FALSE(controller->addObserver(nullptr).has_value());
    REQUIRE(controller->start().has_value());

    source->push(0x130, 1);
    source->push(0x13b, 1);
    source->push(0x03, 32767);
    REQUIRE(waitUntil([&] { return observer.raw().size() == 3; }));
    REQUIRE(waitUntil([&] { return observer.normalized().size() == 2; }));

    REQUIRE(observer.raw() == std::vector<core::u32>{0x130, 0x13b, 0x03});
    REQUIRE(observer.normalized() == std::vector<std::string>{"A", "LEFT_STICK_Y"});
}

TEST_CASE("Controller uses the family mapping unless one is supplied", "[input][controller]")
{
    auto wiiu = makeController(ControllerOptions::Builder{}
        .family(mapping::ControllerFamily::kWiiUPro)
        .build());
    REQUIRE(wiiu.controller->mapping().lookup(0x131)->name == "A");

    auto custom = makeController(ControllerOptions::Builder{}
        .family(mapping::ControllerFamily::kWiiUPro)
        .mapping(mapping::MappingConfig{}.button(0x131, "B"))
        .build());
    REQUIRE(custom.controller->mapping().size() == 1);
    REQUIRE(custom.controller->mapping().lookup(0x131)->name == "B");
}

TEST_CASE("Controller creation fails on an invalid mapping", "[input][controller]")
{
    auto invalid = Controller::create(
        std::make_unique<QueueSource>(),
        ControllerOptions::Builder{}
            .mapping(mapping::MappingConfig{}.button(0x130, "A").button(0x130, "B"))
            .build());
    REQUIRE_FALSE(invalid.has_value());
    REQUIRE(invalid.error().code() == core::ErrorCode::kConfigError);

    auto missing = Controller::create(nullptr);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Controller reports a source that cannot be opened", "[input][controller]")
{
    auto fixture = makeScenarioController();
    auto* source = fixture.source;
    auto& controller = fixture.controller;
    REQUIRE(source->open().has_value());

    auto started = controller->start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().code() == core::ErrorCode::kAlreadyRunning);
    REQUIRE(controller->lifecycle() == ControllerLifecycle::kStopped);
    REQUIRE_FALSE(controller->poll().running);
}

} // namespace btpad::input
