/**
 * @file TestConfigLoader.cpp
 * @brief Unit tests for btpad::mapping::ConfigLoader.
 */

#include <catch2/catch_test_macros.hpp>

#include "btpad/mapping/ConfigLoader.hpp"
#include "btpad/mapping/MappingTable.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace btpad::mapping {

namespace {

class TempMappingFile {
public:
    explicit TempMappingFile(const std::string& content)
        : path_(std::filesystem::temp_directory_path() / "btpad_mapping_test.map")
    {
        std::ofstream ofs(path_);
        ofs << content;
    }

    ~TempMappingFile() { std::filesystem::remove(path_); }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

core::Expected<MappingConfig> parseText(const std::string& text)
{
    std::istringstream in(text);
    return ConfigLoader::parse(in, "inline");
}

} // namespace

TEST_CASE("ConfigLoader parses buttons, axes and steps", "[mapping][config]")
{
    auto config = parseText(
        "# code, name, kind[, steps]\n"
        "0x130, A, button\n"
        "\n"
        "  305 , B , BUTTON, invert\n"
        "0x03, LEFT_STICK_Y, axis, scale(-32768;32767) | Deadzone(2000) | invert\n");

    REQUIRE(config.has_value());
    REQUIRE(config->records.size() == 3);

    const auto& a = config->records[0];
    REQUIRE(a.code == 0x130);
    REQUIRE(a.name == "A");
    REQUIRE(a.kind == ControlKind::kButton);
    REQUIRE(a.normalization.empty());

    const auto& b = config->records[1];
    REQUIRE(b.code == 305);
    REQUIRE(b.name == "B");
    REQUIRE(b.normalization.size() == 1);
    REQUIRE(b.normalization[0].kind == NormalizationKind::kInvert);

    const auto& stick = config->records[2];
    REQUIRE(stick.kind == ControlKind::kAxis);
    REQUIRE(stick.normalization.size() == 3);
    REQUIRE(stick.normalization[0].kind == NormalizationKind::kScaleToUnit);
    REQUIRE(stick.normalization[0].first == -32768);
    REQUIRE(stick.normalization[0].second == 32767);
    REQUIRE(stick.normalization[1].kind == NormalizationKind::kDeadzone);
    REQUIRE(stick.normalization[1].first == 2000);
    REQUIRE(stick.normalization[2].kind == NormalizationKind::kInvert);
}

TEST_CASE("ConfigLoader reports the offending line", "[mapping][config]")
{
    auto config = parseText("0x130, A, button\n0x131, B, trigger\n");

    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error().code() == core::ErrorCode::kConfigError);
    REQUIRE(config.error().message().rfind("inline:2:", 0) == 0);
}

TEST_CASE("ConfigLoader rejects malformed fields", "[mapping][config]")
{
    REQUIRE_FALSE(parseText("0x130, A\n").has_value());
    REQUIRE_FALSE(parseText("0xZZ, A, button\n").has_value());
    REQUIRE_FALSE(parseText("0x130, , button\n").has_value());
    REQUIRE_FALSE(parseText("0x03, X, axis, scale(1)\n").has_value());
    REQUIRE_FALSE(parseText("0x03, X, axis, scale(a;b)\n").has_value());
    REQUIRE_FALSE(parseText("0x03, X, axis, deadzone(5\n").has_value());
    REQUIRE_FALSE(parseText("0x03, X, axis, smooth(3)\n").has_value());
    REQUIRE_FALSE(parseText("0x03, X, axis, invert(1)\n").has_value());
}

TEST_CASE("ConfigLoader output feeds MappingTable validation", "[mapping][config]")
{
    auto config = parseText("0x130, A, button\n0x130, B, button\n");
    REQUIRE(config.has_value());

    auto table = MappingTable::load(*config);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().code() == core::ErrorCode::kConfigError);
}

TEST_CASE("An axis line without scale never yields a table", "[mapping][config]")
{
    auto config = parseText("0x03, LEFT_STICK_Y, axis\n");
    REQUIRE(config.has_value());

    auto table = MappingTable::load(*config);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().code() == core::ErrorCode::kConfigError);
    REQUIRE(table.error().message().find("LEFT_STICK_Y") != std::string::npos);
}

TEST_CASE("ConfigLoader reads a mapping file", "[mapping][config][file]")
{
    TempMappingFile file("0x131, A, button\n0x130, B, button\n");

    auto config = ConfigLoader::fromFile(file.path());
    REQUIRE(config.has_value());
    REQUIRE(config->records.size() == 2);
    REQUIRE(config->records[0].name == "A");
    REQUIRE(config->records[0].code == 0x131);
}

TEST_CASE("ConfigLoader reports a missing file", "[mapping][config][file]")
{
    auto config = ConfigLoader::fromFile("/nonexistent/btpad.map");
    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error().code() == core::ErrorCode::kFileNotFound);
}

} // namespace btpad::mapping
