// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerFamily.cpp
/// @brief Built-in mapping tables.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/mapping/ControllerFamily.hpp>

#include <string>

namespace btpad::mapping {

namespace {

// linux/input-event-codes.h
constexpr core::u32 kAbsX         = 0x00;
constexpr core::u32 kAbsY         = 0x01;
constexpr core::u32 kAbsRx        = 0x03;
constexpr core::u32 kAbsRy        = 0x04;
constexpr core::u32 kAbsHat0X     = 0x10;
constexpr core::u32 kAbsHat0Y     = 0x11;

constexpr core::u32 kBtnSouth     = 0x130;
constexpr core::u32 kBtnEast      = 0x131;
constexpr core::u32 kBtnNorth     = 0x133;
constexpr core::u32 kBtnWest      = 0x134;
constexpr core::u32 kBtnTl        = 0x136;
constexpr core::u32 kBtnTr        = 0x137;
constexpr core::u32 kBtnTl2       = 0x138;
constexpr core::u32 kBtnTr2       = 0x139;
constexpr core::u32 kBtnSelect    = 0x13a;
constexpr core::u32 kBtnStart     = 0x13b;
constexpr core::u32 kBtnMode      = 0x13c;
constexpr core::u32 kBtnThumbL    = 0x13d;
constexpr core::u32 kBtnThumbR    = 0x13e;

constexpr core::u32 kBtnDpadUp    = 0x220;
constexpr core::u32 kBtnDpadDown  = 0x221;
constexpr core::u32 kBtnDpadLeft  = 0x222;
constexpr core::u32 kBtnDpadRight = 0x223;

void addShoulderAndSystemButtons(MappingConfig& config)
{
    config.button(kBtnTl,     "L1")
          .button(kBtnTr,     "R1")
          .button(kBtnTl2,    "L2")
          .button(kBtnTr2,    "R2")
          .button(kBtnSelect, "SELECT")
          .button(kBtnStart,  "START")
          .button(kBtnMode,   "MODE")
          .button(kBtnThumbL, "L3")
          .button(kBtnThumbR, "R3");
}

void addSticks(MappingConfig& config, core::i32 min, core::i32 max, core::i32 deadzone)
{
    using Step = NormalizationStep;
    config.axis(kAbsX,  "LEFT_STICK_X",  {Step::scale(min, max), Step::deadzone(deadzone)})
          .axis(kAbsY,  "LEFT_STICK_Y",  {Step::scale(min, max), Step::deadzone(deadzone), Step::invert()})
          .axis(kAbsRx, "RIGHT_STICK_X", {Step::scale(min, max), Step::deadzone(deadzone)})
          .axis(kAbsRy, "RIGHT_STICK_Y", {Step::scale(min, max), Step::deadzone(deadzone), Step::invert()});
}

// The hat reports -1 for up; inverted so that PAD_Y reads +1 for up like
// the sticks.
void addHat(MappingConfig& config)
{
    using Step = NormalizationStep;
    config.axis(kAbsHat0X, "PAD_X", {Step::scale(-1, 1)})
          .axis(kAbsHat0Y, "PAD_Y", {Step::scale(-1, 1), Step::invert()});
}

MappingConfig genericGamepad()
{
    MappingConfig config;
    config.button(kBtnSouth, "A")
          .button(kBtnEast,  "B")
          .button(kBtnNorth, "X")
          .button(kBtnWest,  "Y");
    addShoulderAndSystemButtons(config);
    addSticks(config, -32768, 32767, 2000);
    addHat(config);
    return config;
}

// hid-wiimote reports the Nintendo layout: A on the east face, B south.
MappingConfig wiiUPro()
{
    MappingConfig config;
    config.button(kBtnEast,  "A")
          .button(kBtnSouth, "B")
          .button(kBtnNorth, "X")
          .button(kBtnWest,  "Y");
    addShoulderAndSystemButtons(config);
    config.button(kBtnDpadUp,    "PAD_UP")
          .button(kBtnDpadDown,  "PAD_DOWN")
          .button(kBtnDpadLeft,  "PAD_LEFT")
          .button(kBtnDpadRight, "PAD_RIGHT");
    addSticks(config, -1280, 1280, 80);
    return config;
}

// Cross, circle, triangle and square take the A, B, X and Y names.
MappingConfig dualShock4()
{
    MappingConfig config;
    config.button(kBtnSouth, "A")
          .button(kBtnEast,  "B")
          .button(kBtnNorth, "X")
          .button(kBtnWest,  "Y");
    addShoulderAndSystemButtons(config);
    addSticks(config, 0, 255, 8);
    addHat(config);
    return config;
}

} // namespace

std::string_view familyName(ControllerFamily family) noexcept
{
    switch (family)
    {
        case ControllerFamily::kGenericGamepad: return "generic";
        case ControllerFamily::kWiiUPro:        return "wiiu-pro";
        case ControllerFamily::kDualShock4:     return "dualshock4";
    }
    return "unknown";
}

core::Expected<ControllerFamily> parseFamily(std::string_view name)
{
    for (auto family : {ControllerFamily::kGenericGamepad,
                        ControllerFamily::kWiiUPro,
                        ControllerFamily::kDualShock4})
    {
        if (familyName(family) == name)
            return family;
    }
    return core::makeError(core::ErrorCode::kConfigError,
        "unknown controller family '" + std::string{name} + "'");
}

MappingConfig defaultMapping(ControllerFamily family)
{
    switch (family)
    {
        case ControllerFamily::kGenericGamepad: return genericGamepad();
        case ControllerFamily::kWiiUPro:        return wiiUPro();
        case ControllerFamily::kDualShock4:     return dualShock4();
    }
    return {};
}

} // namespace btpad::mapping
