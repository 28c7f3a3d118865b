// /////////////////////////////////////////////////////////////////////////////
/// @file MappingTable.cpp
/// @brief MappingTable validation and lookup.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/mapping/MappingTable.hpp>
#include <btpad/core/Log.hpp>

#include <cstdio>
#include <string>

namespace btpad::mapping {

namespace {

std::string describe(const MappingRecord& record)
{
    char code[16];
    std::snprintf(code, sizeof(code), "0x%x", static_cast<unsigned>(record.code));
    return std::string{code} + " (" + (record.name.empty() ? "<unnamed>" : record.name) + ")";
}

bool isKnownKind(ControlKind kind) noexcept
{
    switch (kind)
    {
        case ControlKind::kButton:
        case ControlKind::kAxis:
            return true;
    }
    return false;
}

core::Expected<Normalization> compile(const MappingRecord& record)
{
    Normalization out{};
    bool seen[4] = {false, false, false, false};

    for (const auto& step : record.normalization)
    {
        const auto index = static_cast<core::usize>(step.kind);
        if (index >= 4)
        {
            return core::makeError(core::ErrorCode::kConfigError,
                "unrecognized normalization kind " + std::to_string(index) +
                " for " + describe(record));
        }
        if (seen[index] && step.kind != NormalizationKind::kPassThrough)
        {
            return core::makeError(core::ErrorCode::kConfigError,
                std::string{"normalization '"} + std::string{normalizationKindName(step.kind)} +
                "' listed twice for " + describe(record));
        }
        seen[index] = true;

        if (record.kind == ControlKind::kButton &&
            step.kind != NormalizationKind::kPassThrough &&
            step.kind != NormalizationKind::kInvert)
        {
            return core::makeError(core::ErrorCode::kConfigError,
                std::string{"normalization '"} + std::string{normalizationKindName(step.kind)} +
                "' does not apply to button " + describe(record));
        }

        switch (step.kind)
        {
            case NormalizationKind::kPassThrough:
                break;
            case NormalizationKind::kScaleToUnit:
                if (step.first >= step.second)
                {
                    return core::makeError(core::ErrorCode::kConfigError,
                        "scale range [" + std::to_string(step.first) + ", " +
                        std::to_string(step.second) + "] is empty for " + describe(record));
                }
                out.scaled = true;
                out.rawMin = step.first;
                out.rawMax = step.second;
                break;
            case NormalizationKind::kInvert:
                out.inverted = true;
                break;
            case NormalizationKind::kDeadzone:
                if (step.first < 0)
                {
                    return core::makeError(core::ErrorCode::kConfigError,
                        "negative deadzone for " + describe(record));
                }
                out.deadzone = step.first;
                break;
        }
    }

    if (record.kind == ControlKind::kAxis && !out.scaled)
    {
        return core::makeError(core::ErrorCode::kConfigError,
            "axis " + describe(record) + " has no scale range");
    }
    return out;
}

} // namespace

core::Expected<MappingTable> MappingTable::load(const MappingConfig& config)
{
    MappingTable table;
    table.entries_.reserve(config.records.size());
    table.byCode_.reserve(config.records.size());

    for (const auto& record : config.records)
    {
        if (record.name.empty())
        {
            return core::makeError(core::ErrorCode::kConfigError,
                "empty logical name for " + describe(record));
        }
        if (!isKnownKind(record.kind))
        {
            return core::makeError(core::ErrorCode::kConfigError,
                "unrecognized control kind for " + describe(record));
        }
        if (table.byCode_.contains(record.code))
        {
            return core::makeError(core::ErrorCode::kConfigError,
                "duplicate raw code " + describe(record));
        }

        auto normalization = compile(record);
        if (!normalization)
        {
            return std::unexpected(std::move(normalization.error()));
        }

        MappingEntry entry;
        entry.code          = record.code;
        entry.name          = record.name;
        entry.kind          = record.kind;
        entry.normalization = *normalization;

        if (auto slot = table.slotOf(record.name))
        {
            entry.slot = *slot;
        }
        else
        {
            entry.slot = static_cast<core::u32>(table.names_.size());
            table.names_.push_back(record.name);
        }

        table.byCode_.emplace(record.code, table.entries_.size());
        table.entries_.push_back(std::move(entry));
    }

    return table;
}

core::Expected<MappingTable> MappingTable::forFamily(ControllerFamily family)
{
    auto table = load(defaultMapping(family));
    if (table)
    {
        core::Log::debug("mapping", "built-in table '" + std::string{familyName(family)} +
                                    "': " + std::to_string(table->size()) + " entries");
    }
    return table;
}

const MappingEntry* MappingTable::lookup(core::u32 code) const noexcept
{
    const auto it = byCode_.find(code);
    return it == byCode_.end() ? nullptr : &entries_[it->second];
}

std::optional<core::u32> MappingTable::slotOf(std::string_view name) const noexcept
{
    for (core::usize i = 0; i < names_.size(); ++i)
    {
        if (names_[i] == name)
            return static_cast<core::u32>(i);
    }
    return std::nullopt;
}

} // namespace btpad::mapping
