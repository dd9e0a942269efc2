#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "digest.hpp"
#include "filter_parser.hpp"
#include "loader.hpp"
#include "site.hpp"

std::vector<Site> build_registry(const std::vector<std::string> &lines)
{
    std::vector<Site> sites;
    FilterChain latest_filters;
    for (auto line : lines)
    {
        trim(line);
        if (line.empty())
        {
            latest_filters.clear();
        }
        else if (line.front() == '#')
        {
            if (auto filter = parse_filter(line))
            {
                latest_filters.push_back(std::move(*filter));
            }
        }
        else
        {
            sites.push_back(Site{std::move(line), latest_filters});
        }
    }
    return sites;
}

std::vector<Site> read_sites(const std::string &filename)
{
    return build_registry(read_lines(filename));
}

std::string derive_password(std::string_view site_name,
                            std::string_view master_password,
                            const FilterChain &filters)
{
    Digest digest(fmt::format("{}:{}", site_name, master_password));
    return apply_filters(filters, digest.working_string());
}

std::string format_passwords(const std::vector<Site> &sites,
                             std::string_view master_password)
{
    std::size_t longest_name = 0;
    for (const auto &site : sites)
    {
        longest_name = std::max(longest_name, site.name.size());
    }
    std::string out;
    for (const auto &site : sites)
    {
        fmt::format_to(std::back_inserter(out), "{}:{:{}}{}\n", site.name, "",
                       longest_name - site.name.size() + 1,
                       derive_password(site, master_password));
    }
    return out;
}
