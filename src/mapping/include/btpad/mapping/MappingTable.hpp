// /////////////////////////////////////////////////////////////////////////////
/// @file MappingTable.hpp
/// @brief Immutable lookup table from raw event codes to logical controls.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/ControllerFamily.hpp>
#include <btpad/mapping/MappingConfig.hpp>
#include <btpad/mapping/MappingEntry.hpp>
#include <btpad/core/Expected.hpp>
#include <btpad/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace btpad::mapping {

// /////////////////////////////////////////////////////////////////////////////
/// @class MappingTable
/// @brief Validated set of MappingEntry, keyed by raw code.
///
/// Built once, by load() or forFamily(), and never mutated afterwards: the
/// producer thread reads it without synchronisation. Every raw code maps to
/// at most one entry; several codes may share a logical name, in which case
/// they share one control slot.
// /////////////////////////////////////////////////////////////////////////////
class MappingTable
{
public:
    /// @brief Validates @p config and builds a table from it.
    /// @return The complete table, or kConfigError. No partial table is
    ///         ever produced.
    [[nodiscard]] static core::Expected<MappingTable> load(const MappingConfig& config);

    /// @brief Builds the built-in table of @p family.
    [[nodiscard]] static core::Expected<MappingTable> forFamily(ControllerFamily family);

    /// @brief Entry for @p code, or nullptr if the code is not mapped.
    [[nodiscard]] const MappingEntry* lookup(core::u32 code) const noexcept;

    /// @brief Slot index of a logical control name.
    [[nodiscard]] std::optional<core::u32> slotOf(std::string_view name) const noexcept;

    /// @brief Logical control names, indexed by slot.
    [[nodiscard]] const std::vector<std::string>& controlNames() const noexcept { return names_; }

    /// @brief Entries in configuration order.
    [[nodiscard]] const std::vector<MappingEntry>& entries() const noexcept { return entries_; }

    [[nodiscard]] core::usize size() const noexcept { return entries_.size(); }
    [[nodiscard]] core::usize controlCount() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    MappingTable() = default;

    std::vector<MappingEntry>                    entries_;
    std::unordered_map<core::u32, core::usize>   byCode_;
    std::vector<std::string>                     names_;
};

} // namespace btpad::mapping
