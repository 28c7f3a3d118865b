// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerFamily.hpp
/// @brief Supported controller families and their built-in mappings.
///
/// Defaults are expressed in Linux evdev codes (linux/input-event-codes.h)
/// and use the same logical names for every family: A, B, X, Y, L1, R1,
/// L2, R2, SELECT, START, MODE, L3, R3, PAD_UP, PAD_DOWN, PAD_LEFT,
/// PAD_RIGHT, LEFT_STICK_X, LEFT_STICK_Y, RIGHT_STICK_X, RIGHT_STICK_Y.
/// Stick Y axes are inverted so that pushing forward reads positive.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/MappingConfig.hpp>
#include <btpad/core/Expected.hpp>
#include <btpad/core/Types.hpp>

#include <string_view>

namespace btpad::mapping {

enum class ControllerFamily : core::u8
{
    kGenericGamepad,   ///< evdev gamepad convention, sticks on [-32768, 32767]
    kWiiUPro,          ///< Wii U Pro via hid-wiimote, sticks on [-1280, 1280]
    kDualShock4        ///< DualShock 4 via hid-playstation, sticks on [0, 255]
};

/// @brief Canonical name of a family ("generic", "wiiu-pro", "dualshock4").
[[nodiscard]] std::string_view familyName(ControllerFamily family) noexcept;

/// @brief Parses a family name; unknown names yield kConfigError.
[[nodiscard]] core::Expected<ControllerFamily> parseFamily(std::string_view name);

/// @brief Built-in mapping configuration of @p family.
[[nodiscard]] MappingConfig defaultMapping(ControllerFamily family);

} // namespace btpad::mapping
