// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerSnapshot.hpp
/// @brief Immutable point-in-time copy of every logical control value.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/MappingTable.hpp>
#include <btpad/core/Types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace btpad::input {

// /////////////////////////////////////////////////////////////////////////////
/// @class ControllerSnapshot
/// @brief Values indexed by the control slots of a MappingTable.
///
/// Buttons read 0 or 1, scaled axes lie in [-1, 1]. A snapshot never
/// changes once published; it keeps its mapping table alive.
// /////////////////////////////////////////////////////////////////////////////
class ControllerSnapshot
{
public:
    ControllerSnapshot(std::shared_ptr<const mapping::MappingTable> table,
                       std::vector<core::f64> values,
                       core::u64 sequence);

    /// @brief All-neutral snapshot of @p table (every value 0, sequence 0).
    [[nodiscard]] static std::shared_ptr<const ControllerSnapshot> neutral(
        std::shared_ptr<const mapping::MappingTable> table);

    /// @brief Value of a logical control, std::nullopt if the name is not
    ///        part of the mapping.
    [[nodiscard]] std::optional<core::f64> value(std::string_view name) const noexcept;

    /// @brief Value of a logical control, 0 if the name is unknown.
    [[nodiscard]] core::f64 valueOr(std::string_view name, core::f64 fallback = 0.0) const noexcept;

    /// @brief True when the control reads at least 0.5.
    [[nodiscard]] bool pressed(std::string_view name) const noexcept;

    [[nodiscard]] core::f64 at(core::u32 slot) const noexcept;

    [[nodiscard]] core::usize size() const noexcept { return values_.size(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept;
    [[nodiscard]] const std::vector<core::f64>& values() const noexcept { return values_; }
    [[nodiscard]] const std::shared_ptr<const mapping::MappingTable>& table() const noexcept { return table_; }

    /// @brief Number of value changes published before this snapshot.
    [[nodiscard]] core::u64 sequence() const noexcept { return sequence_; }

    /// @brief Calls @p fn(name, value) for every control, in slot order.
    template <typename F>
    void forEach(F&& fn) const
    {
        const auto& controlNames = names();
        for (core::usize i = 0; i < values_.size(); ++i)
            fn(std::string_view{controlNames[i]}, values_[i]);
    }

private:
    std::shared_ptr<const mapping::MappingTable> table_;
    std::vector<core::f64>                       values_;
    core::u64                                    sequence_{0};
};

} // namespace btpad::input
