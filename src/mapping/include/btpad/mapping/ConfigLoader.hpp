// /////////////////////////////////////////////////////////////////////////////
/// @file ConfigLoader.hpp
/// @brief Reads a mapping description from a text file.
///
/// One entry per line, comma separated; '#' starts a comment line:
/// @code
///   # code, name, kind[, step[|step...]]
///   0x130, A, button
///   0x03,  LEFT_STICK_Y, axis, scale(-32768;32767)|deadzone(2000)|invert
/// @endcode
/// Steps: passthrough, invert, scale(min;max), deadzone(threshold). Codes
/// are decimal or 0x-prefixed hexadecimal.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/MappingConfig.hpp>
#include <btpad/core/Expected.hpp>

#include <filesystem>
#include <istream>
#include <string_view>

namespace btpad::mapping {

class ConfigLoader
{
public:
    ConfigLoader() = delete;

    /// @brief Parses @p path. A missing file yields kFileNotFound, any
    ///        malformed line kConfigError with its line number.
    [[nodiscard]] static core::Expected<MappingConfig> fromFile(const std::filesystem::path& path);

    /// @brief Parses mapping text from @p in; @p origin names it in errors.
    [[nodiscard]] static core::Expected<MappingConfig> parse(std::istream& in,
                                                             std::string_view origin);
};

} // namespace btpad::mapping
