/**
 * @file TestReplaySource.cpp
 * @brief Unit tests for btpad::input::ReplaySource.
 */

#include <catch2/catch_test_macros.hpp>

#include "btpad/input/ReplaySource.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace btpad::input {

namespace {

class TempRecording {
public:
    explicit TempRecording(const std::string& content)
        : path_(std::filesystem::temp_directory_path() / "btpad_replay_test.txt")
    {
        std::ofstream ofs(path_);
        ofs << content;
    }

    ~TempRecording() { std::filesystem::remove(path_); }

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("ReplaySource plays a recording back in order", "[input][replay]")
{
    TempRecording recording("# code, value\n0x130, 1\n0x130,0\n\n3, -250\n");

    ReplaySource source(ReplayConfig{recording.path(), 0.0});
    REQUIRE(source.open().has_value());
    REQUIRE(source.totalEvents() == 3);

    auto first = source.read();
    REQUIRE(first.has_value());
    REQUIRE(first->code == 0x130);
    REQUIRE(first->value == 1);

    auto second = source.read();
    REQUIRE(second->value == 0);

    auto third = source.read();
    REQUIRE(third->code == 3);
    REQUIRE(third->value == -250);
    REQUIRE(source.cursor() == 3);

    auto end = source.read();
    REQUIRE_FALSE(end.has_value());
    REQUIRE(end.error().code() == core::ErrorCode::kSourceDisconnected);
}

TEST_CASE("ReplaySource rejects a malformed recording", "[input][replay]")
{
    TempRecording recording("0x130, 1\nnot an event\n");

    ReplaySource source(ReplayConfig{recording.path(), 0.0});
    auto result = source.open();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kSourceReadError);
}

TEST_CASE("ReplaySource reports a missing recording", "[input][replay]")
{
    ReplaySource source(ReplayConfig{"/nonexistent/recording.txt", 0.0});
    auto result = source.open();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kFileNotFound);
}

TEST_CASE("ReplaySource cancel interrupts paced playback", "[input][replay]")
{
    TempRecording recording("0x130, 1\n0x130, 0\n");

    ReplaySource source(ReplayConfig{recording.path(), 0.5});
    REQUIRE(source.open().has_value());
    REQUIRE(source.read().has_value());

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = source.read();
    canceller.join();

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kCancelled);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(1));
}

} // namespace btpad::input
