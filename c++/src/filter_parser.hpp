#pragma once

#include <optional>
#include <string_view>

#include "filter.hpp"

// `# @substring 0 8` and the like
std::optional<Filter> parse_filter(std::string_view line);
