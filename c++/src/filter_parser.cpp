#include <cctype>
#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "filter_parser.hpp"

static inline bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c));
}

static std::vector<std::string_view> split_fields(std::string_view line)
{
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < line.size())
    {
        while (pos < line.size() && is_space(line[pos]))
        {
            pos++;
        }
        auto start = pos;
        while (pos < line.size() && !is_space(line[pos]))
        {
            pos++;
        }
        if (pos > start)
        {
            fields.push_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

static int parse_int(std::string_view field, int fallback)
{
    if (field.size() > 1 && field.front() == '+' && field[1] != '-')
    {
        field.remove_prefix(1);
    }
    int value = 0;
    auto [end, ec] =
        std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || end != field.data() + field.size())
    {
        return fallback;
    }
    return value;
}

// Length of the UTF-8 sequence introduced by `lead`; invalid lead bytes
// count as a single character.
static std::size_t utf8_sequence_length(unsigned char lead)
{
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

static std::string first_character(std::string_view str)
{
    auto length = utf8_sequence_length(static_cast<unsigned char>(str.front()));
    return std::string(str.substr(0, length));
}

std::optional<Filter> parse_filter(std::string_view line)
{
    auto fields = split_fields(line);
    if (fields.size() < 2 || !fields[1].starts_with('@'))
    {
        return std::nullopt;
    }
    auto name = fields[1].substr(1);
    auto args = std::span{fields}.subspan(2);

    if (name == "replace")
    {
        if (args.size() != 2 || args[0].empty())
        {
            return std::nullopt;
        }
        return ReplaceFilter{std::string(args[0]), std::string(args[1])};
    }
    if (name == "skip")
    {
        if (args.size() != 1 || args[0].empty())
        {
            return std::nullopt;
        }
        return SkipFilter{first_character(args[0])};
    }
    if (name == "substring")
    {
        if (args.empty() || args.size() > 2)
        {
            return std::nullopt;
        }
        SubstringFilter filter;
        filter.start = parse_int(args[0], 0);
        if (args.size() == 2)
        {
            filter.length = parse_int(args[1], -1);
        }
        return filter;
    }
    // Stray arguments after the zero-argument filters are ignored
    if (name == "digit")
    {
        return DigitFilter{};
    }
    if (name == "uppercase")
    {
        return UppercaseFilter{};
    }
    if (name == "lowercase")
    {
        return LowercaseFilter{};
    }
    return std::nullopt;
}
