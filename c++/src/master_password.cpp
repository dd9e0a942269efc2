#include <filesystem>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "loader.hpp"
#include "master_password.hpp"

namespace fs = std::filesystem;

bool is_accessible_only_by_owner(const std::string &filename)
{
    std::error_code ec;
    auto status = fs::status(filename, ec);
    if (ec || !fs::exists(status))
    {
        throw LoadError(fmt::format("cannot stat {}: {}", filename,
                                    ec ? ec.message() : "no such file"));
    }
    constexpr auto group_or_others = fs::perms::group_all | fs::perms::others_all;
    return (status.permissions() & group_or_others) == fs::perms::none;
}

std::string load_master_password(const std::string &filename)
{
    if (!is_accessible_only_by_owner(filename))
    {
        fmt::print(stderr, "WARN: {} should be accessible only by the owner.\n",
                   filename);
    }
    auto password = read_contents(filename);
    trim(password);
    return password;
}
