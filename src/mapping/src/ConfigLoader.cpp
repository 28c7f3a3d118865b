// /////////////////////////////////////////////////////////////////////////////
/// @file ConfigLoader.cpp
/// @brief Line-oriented mapping file parser.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/mapping/ConfigLoader.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <vector>

namespace btpad::mapping {

namespace {

std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

std::vector<std::string_view> split(std::string_view text, char separator)
{
    std::vector<std::string_view> parts;
    core::usize start = 0;
    for (;;)
    {
        const auto pos = text.find(separator, start);
        parts.push_back(trim(text.substr(start, pos - start)));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return parts;
}

std::string lower(std::string_view text)
{
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

class LineParser
{
public:
    LineParser(std::string_view origin, core::usize line)
        : origin_{origin}, line_{line}
    {}

    [[nodiscard]] core::Unexpected fail(const std::string& what) const
    {
        return core::makeError(core::ErrorCode::kConfigError,
            std::string{origin_} + ":" + std::to_string(line_) + ": " + what);
    }

    [[nodiscard]] core::Expected<core::u32> code(std::string_view text) const
    {
        int base = 10;
        if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        {
            text.remove_prefix(2);
            base = 16;
        }
        core::u32 value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            return fail("invalid event code '" + std::string{text} + "'");
        return value;
    }

    [[nodiscard]] core::Expected<core::i32> integer(std::string_view text) const
    {
        text = trim(text);
        core::i32 value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
            return fail("invalid integer '" + std::string{text} + "'");
        return value;
    }

    [[nodiscard]] core::Expected<ControlKind> kind(std::string_view text) const
    {
        const auto name = lower(text);
        if (name == "button")
            return ControlKind::kButton;
        if (name == "axis")
            return ControlKind::kAxis;
        return fail("unrecognized control kind '" + std::string{text} + "'");
    }

    [[nodiscard]] core::Expected<NormalizationStep> step(std::string_view text) const
    {
        std::string_view name = text;
        std::vector<std::string_view> args;

        if (const auto open = text.find('('); open != std::string_view::npos)
        {
            if (text.back() != ')')
                return fail("unterminated parameter list in '" + std::string{text} + "'");
            name = trim(text.substr(0, open));
            args = split(text.substr(open + 1, text.size() - open - 2), ';');
        }

        const auto kindName = lower(name);
        if (kindName == "passthrough" || kindName == "invert")
        {
            if (!args.empty())
                return fail("'" + kindName + "' takes no parameters");
            return kindName == "invert" ? NormalizationStep::invert()
                                        : NormalizationStep::passThrough();
        }
        if (kindName == "scale")
        {
            if (args.size() != 2)
                return fail("scale expects (min;max)");
            auto min = integer(args[0]);
            if (!min)
                return std::unexpected(std::move(min.error()));
            auto max = integer(args[1]);
            if (!max)
                return std::unexpected(std::move(max.error()));
            return NormalizationStep::scale(*min, *max);
        }
        if (kindName == "deadzone")
        {
            if (args.size() != 1)
                return fail("deadzone expects (threshold)");
            auto threshold = integer(args[0]);
            if (!threshold)
                return std::unexpected(std::move(threshold.error()));
            return NormalizationStep::deadzone(*threshold);
        }
        return fail("unrecognized normalization '" + std::string{name} + "'");
    }

    [[nodiscard]] core::Expected<MappingRecord> record(std::string_view text) const
    {
        const auto fields = split(text, ',');
        if (fields.size() < 3 || fields.size() > 4)
            return fail("expected 'code, name, kind[, steps]'");

        MappingRecord out;

        auto parsedCode = code(fields[0]);
        if (!parsedCode)
            return std::unexpected(std::move(parsedCode.error()));
        out.code = *parsedCode;

        if (fields[1].empty())
            return fail("empty logical name");
        out.name = std::string{fields[1]};

        auto parsedKind = kind(fields[2]);
        if (!parsedKind)
            return std::unexpected(std::move(parsedKind.error()));
        out.kind = *parsedKind;

        if (fields.size() == 4 && !fields[3].empty())
        {
            for (const auto stepText : split(fields[3], '|'))
            {
                auto parsedStep = step(stepText);
                if (!parsedStep)
                    return std::unexpected(std::move(parsedStep.error()));
                out.normalization.push_back(*parsedStep);
            }
        }
        return out;
    }

private:
    std::string_view origin_;
    core::usize      line_;
};

} // namespace

core::Expected<MappingConfig> ConfigLoader::fromFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return core::makeError(core::ErrorCode::kFileNotFound, path.string());
    }
    return parse(file, path.string());
}

core::Expected<MappingConfig> ConfigLoader::parse(std::istream& in, std::string_view origin)
{
    MappingConfig config;
    std::string line;
    core::usize lineNumber = 0;

    while (std::getline(in, line))
    {
        ++lineNumber;
        const auto text = trim(line);
        if (text.empty() || text.front() == '#')
            continue;

        auto record = LineParser{origin, lineNumber}.record(text);
        if (!record)
            return std::unexpected(std::move(record.error()));
        config.records.push_back(std::move(*record));
    }

    return config;
}

} // namespace btpad::mapping
