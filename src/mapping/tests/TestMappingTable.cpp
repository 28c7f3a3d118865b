/**
 * @file TestMappingTable.cpp
 * @brief Unit tests for btpad::mapping::MappingTable.
 */

#include <catch2/catch_test_macros.hpp>

#include "btpad/mapping/MappingTable.hpp"

namespace btpad::mapping {

using Step = NormalizationStep;

TEST_CASE("MappingTable looks entries up by raw code", "[mapping][table]")
{
    MappingConfig config;
    config.button(0x130, "A")
          .axis(0x03, "LEFT_STICK_Y", {Step::scale(-32768, 32767), Step::deadzone(2000)});

    auto table = MappingTable::load(config);
    REQUIRE(table.has_value());
    REQUIRE(table->size() == 2);
    REQUIRE(table->controlCount() == 2);

    const MappingEntry* a = table->lookup(0x130);
    REQUIRE(a != nullptr);
    REQUIRE(a->name == "A");
    REQUIRE(a->kind == ControlKind::kButton);
    REQUIRE(a->slot == 0);

    const MappingEntry* stick = table->lookup(0x03);
    REQUIRE(stick != nullptr);
    REQUIRE(stick->kind == ControlKind::kAxis);
    REQUIRE(stick->normalization.scaled);
    REQUIRE(stick->normalization.rawMin == -32768);
    REQUIRE(stick->normalization.rawMax == 32767);
    REQUIRE(stick->normalization.deadzone == 2000);
    REQUIRE_FALSE(stick->normalization.inverted);

    REQUIRE(table->lookup(0x999) == nullptr);
    REQUIRE(table->slotOf("LEFT_STICK_Y") == 1u);
    REQUIRE_FALSE(table->slotOf("B").has_value());
}

TEST_CASE("MappingTable rejects a duplicated raw code", "[mapping][table]")
{
    MappingConfig config;
    config.button(0x130, "A").button(0x130, "B");

    auto table = MappingTable::load(config);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().code() == core::ErrorCode::kConfigError);
}

TEST_CASE("MappingTable rejects an unrecognized normalization kind", "[mapping][table]")
{
    MappingConfig config;
    config.axis(0x00, "LEFT_STICK_X", {Step{static_cast<NormalizationKind>(42), 0, 0}});

    auto table = MappingTable::load(config);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().code() == core::ErrorCode::kConfigError);
}

TEST_CASE("MappingTable rejects invalid records", "[mapping][table]")
{
    SECTION("empty logical name")
    {
        MappingConfig config;
        config.button(0x130, "");
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }

    SECTION("unknown control kind")
    {
        MappingConfig config;
        config.records.push_back({0x130, "A", static_cast<ControlKind>(9), {}});
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }

    SECTION("empty scale range")
    {
        MappingConfig config;
        config.axis(0x00, "LEFT_STICK_X", {Step::scale(10, 10)});
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }

    SECTION("negative deadzone")
    {
        MappingConfig config;
        config.axis(0x00, "LEFT_STICK_X", {Step::scale(-10, 10), Step::deadzone(-1)});
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }

    SECTION("scaling a button")
    {
        MappingConfig config;
        config.button(0x130, "A", {Step::scale(0, 1)});
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }

    SECTION("step listed twice")
    {
        MappingConfig config;
        config.axis(0x00, "LEFT_STICK_X", {Step::invert(), Step::invert()});
        REQUIRE_FALSE(MappingTable::load(config).has_value());
    }
}

TEST_CASE("MappingTable gives codes sharing a name one slot", "[mapping][table]")
{
    MappingConfig config;
    config.button(0x130, "A").button(0x131, "B").button(0x220, "A");

    auto table = MappingTable::load(config);
    REQUIRE(table.has_value());
    REQUIRE(table->size() == 3);
    REQUIRE(table->controlCount() == 2);
    REQUIRE(table->lookup(0x130)->slot == table->lookup(0x220)->slot);
    REQUIRE(table->controlNames() == std::vector<std::string>{"A", "B"});
}

TEST_CASE("MappingTable builds every built-in family", "[mapping][table][family]")
{
    for (auto family : {ControllerFamily::kGenericGamepad,
                        ControllerFamily::kWiiUPro,
                        ControllerFamily::kDualShock4})
    {
        auto table = MappingTable::forFamily(family);
        REQUIRE(table.has_value());
        REQUIRE_FALSE(table->empty());
        REQUIRE(table->slotOf("A").has_value());
        REQUIRE(table->slotOf("LEFT_STICK_Y").has_value());
    }
}

} // namespace btpad::mapping
