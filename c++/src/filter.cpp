#include <algorithm>
#include <string>
#include <string_view>

#include "filter.hpp"

template <typename... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <typename... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static std::string replace_all(std::string_view str, std::string_view from,
                               std::string_view to)
{
    if (from.empty())
    {
        return std::string(str);
    }
    std::string result;
    result.reserve(str.size());
    std::size_t pos = 0;
    for (auto found = str.find(from); found != std::string_view::npos;
         found = str.find(from, pos))
    {
        result.append(str.substr(pos, found - pos));
        result.append(to);
        pos = found + from.size();
    }
    result.append(str.substr(pos));
    return result;
}

static std::string substring(std::string_view str, int start, int length)
{
    auto first = static_cast<std::size_t>(std::max(start, 0));
    if (first >= str.size())
    {
        return {};
    }
    if (length < 0)
    {
        return std::string(str.substr(first));
    }
    return std::string(str.substr(first, static_cast<std::size_t>(length)));
}

static std::string map_digits(std::string_view str)
{
    std::string result;
    result.reserve(str.size());
    for (const auto c : str)
    {
        if (c >= 'a' && c <= 't')
        {
            result.push_back(static_cast<char>('0' + (c - 'a') % 10));
        }
        else if (c >= 'A' && c <= 'T')
        {
            result.push_back(static_cast<char>('0' + (c - 'A') % 10));
        }
        else if ((c >= 'u' && c <= 'z') || (c >= 'U' && c <= 'Z') ||
                 c == '+' || c == '/')
        {
            continue;
        }
        else
        {
            result.push_back(c);
        }
    }
    return result;
}

static std::string to_upper(std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c; });
    return result;
}

static std::string to_lower(std::string_view str)
{
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c; });
    return result;
}

std::string apply_filter(const Filter &filter, std::string_view str)
{
    return std::visit(
        overloaded{
            [str](const ReplaceFilter &f)
            { return replace_all(str, f.from, f.to); },
            [str](const SkipFilter &f)
            { return replace_all(str, f.character, ""); },
            [str](const SubstringFilter &f)
            { return substring(str, f.start, f.length); },
            [str](const DigitFilter &) { return map_digits(str); },
            [str](const UppercaseFilter &) { return to_upper(str); },
            [str](const LowercaseFilter &) { return to_lower(str); },
        },
        filter);
}

std::string apply_filters(const FilterChain &filters, std::string_view str)
{
    std::string result(str);
    for (const auto &filter : filters)
    {
        result = apply_filter(filter, result);
    }
    return result;
}

std::string_view filter_name(const Filter &filter)
{
    return std::visit(
        overloaded{
            [](const ReplaceFilter &) { return std::string_view{"replace"}; },
            [](const SkipFilter &) { return std::string_view{"skip"}; },
            [](const SubstringFilter &)
            { return std::string_view{"substring"}; },
            [](const DigitFilter &) { return std::string_view{"digit"}; },
            [](const UppercaseFilter &)
            { return std::string_view{"uppercase"}; },
            [](const LowercaseFilter &)
            { return std::string_view{"lowercase"}; },
        },
        filter);
}
