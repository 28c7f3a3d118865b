/**
 * @file TestQueueSource.cpp
 * @brief Unit tests for btpad::input::QueueSource.
 */

#include <catch2/catch_test_macros.hpp>

#include "btpad/input/QueueSource.hpp"

#include <chrono>
#include <thread>

namespace btpad::input {

TEST_CASE("QueueSource yields events in push order", "[input][queue]")
{
    QueueSource source;
    REQUIRE(source.open().has_value());

    source.push(0x130, 1);
    source.push(0x130, 0);
    source.push(0x03, -200);
    REQUIRE(source.pending() == 3);

    auto first = source.read();
    auto second = source.read();
    auto third = source.read();

    REQUIRE(first.has_value());
    REQUIRE(first->code == 0x130);
    REQUIRE(first->value == 1);
    REQUIRE(second->value == 0);
    REQUIRE(third->code == 0x03);
    REQUIRE(third->value == -200);
    REQUIRE(source.pending() == 0);
}

TEST_CASE("QueueSource requires open before read", "[input][queue]")
{
    QueueSource source;
    auto result = source.read();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidState);

    REQUIRE(source.open().has_value());
    auto again = source.open();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyRunning);
}

TEST_CASE("QueueSource drains before reporting the end of stream", "[input][queue]")
{
    QueueSource source;
    REQUIRE(source.open().has_value());

    source.push(0x130, 1);
    source.disconnect();

    REQUIRE(source.read().has_value());
    auto end = source.read();
    REQUIRE_FALSE(end.has_value());
    REQUIRE(end.error().code() == core::ErrorCode::kSourceDisconnected);
}

TEST_CASE("QueueSource reports an injected failure", "[input][queue]")
{
    QueueSource source;
    REQUIRE(source.open().has_value());
    source.fail("radio link lost");

    auto result = source.read();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kSourceReadError);
    REQUIRE(result.error().message().find("radio link lost") != std::string::npos);
}

TEST_CASE("QueueSource cancel wakes a blocked read", "[input][queue]")
{
    QueueSource source;
    REQUIRE(source.open().has_value());

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    auto result = source.read();
    canceller.join();

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kCancelled);
}

} // namespace btpad::input
