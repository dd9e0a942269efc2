#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/core.h>

#include "options.hpp"

Options parse_options(int argc, const char *const argv[])
{
    Options options;
    namespace po = boost::program_options;
    po::options_description desc(
        fmt::format("Usage: {} [options] SITES_FILE MASTER_PASS_FILE\n\n"
                    "Allowed options",
                    argv[0]));
    po::options_description hidden;
    po::positional_options_description positional;
    positional.add("sites_file", 1);
    positional.add("master_password_file", 1);
    desc.add_options()("help,h", "show this help message")(
        "verbose,v", "log the sites and filters read to stderr");
    hidden.add_options()("sites_file",
                         po::value<std::string>(&options.sites_filename),
                         "site list file")(
        "master_password_file",
        po::value<std::string>(&options.master_password_filename),
        "master password file");

    po::options_description all;
    all.add(desc).add(hidden);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        std::cout << desc << '\n';
        exit(EXIT_SUCCESS);
    }
    else if (vm.count("sites_file") == 0 ||
             vm.count("master_password_file") == 0)
    {
        throw po::error(
            "Both <SITES_FILE> and <MASTER_PASS_FILE> must be given");
    }

    options.verbose = vm.count("verbose") > 0;
    return options;
}

std::string usage_error_message(const boost::program_options::error &e)
{
    return fmt::format("{}. Use -h to see the help", e.what());
}
