#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "loader.hpp"
#include "master_password.hpp"
#include "options.hpp"
#include "site.hpp"

static void log_sites(const std::vector<Site> &sites,
                      const std::string &filename)
{
    fmt::print(stderr, "Read {} sites from {}\n", sites.size(), filename);
    for (const auto &site : sites)
    {
        std::vector<std::string_view> names;
        for (const auto &filter : site.filters)
        {
            names.push_back(filter_name(filter));
        }
        fmt::print(stderr, "  {} [{}]\n", site.name, fmt::join(names, ", "));
    }
}

int main(int argc, char *argv[])
{
    try
    {
        auto options = parse_options(argc, argv);

        auto sites = read_sites(options.sites_filename);
        if (options.verbose)
        {
            log_sites(sites, options.sites_filename);
        }
        auto master_password =
            load_master_password(options.master_password_filename);

        fmt::print("{}", format_passwords(sites, master_password));
    }
    catch (const boost::program_options::error &e)
    {
        fmt::print(stderr, "{}\n", usage_error_message(e));
        return EXIT_FAILURE;
    }
    catch (const LoadError &e)
    {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
