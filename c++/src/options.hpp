#pragma once

#include <string>

#include <boost/program_options/errors.hpp>

struct Options
{
    std::string sites_filename;
    std::string master_password_filename;
    bool verbose{false};
};

Options parse_options(int argc, const char *const argv[]);

std::string usage_error_message(const boost::program_options::error &e);
