#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

// An empty `from` leaves the input unchanged
struct ReplaceFilter
{
    std::string from;
    std::string to;
};

struct SkipFilter
{
    std::string character;
};

// Negative length keeps the rest of the string; bounds are clamped
struct SubstringFilter
{
    int start{0};
    int length{-1};
};

struct DigitFilter
{};

struct UppercaseFilter
{};

struct LowercaseFilter
{};

using Filter = std::variant<ReplaceFilter, SkipFilter, SubstringFilter,
                            DigitFilter, UppercaseFilter, LowercaseFilter>;
using FilterChain = std::vector<Filter>;

std::string apply_filter(const Filter &filter, std::string_view str);
std::string apply_filters(const FilterChain &filters, std::string_view str);

std::string_view filter_name(const Filter &filter);
