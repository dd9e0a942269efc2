#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "filter.hpp"

struct Site
{
    std::string name;
    FilterChain filters;
};

std::vector<Site> build_registry(const std::vector<std::string> &lines);

std::vector<Site> read_sites(const std::string &filename);

std::string derive_password(std::string_view site_name,
                            std::string_view master_password,
                            const FilterChain &filters);

inline std::string derive_password(const Site &site,
                                   std::string_view master_password)
{
    return derive_password(site.name, master_password, site.filters);
}

std::string format_passwords(const std::vector<Site> &sites,
                             std::string_view master_password);
