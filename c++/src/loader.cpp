#include <algorithm>
#include <cctype>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "loader.hpp"

static inline bool not_space(char c)
{
    return !std::isspace(static_cast<unsigned char>(c));
}

void trim(std::string &s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static std::ifstream open_file(const std::string &filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file)
    {
        throw LoadError(fmt::format("cannot open {}", filename));
    }
    return file;
}

std::vector<std::string> read_lines(const std::string &filename)
{
    auto file = open_file(filename);
    std::vector<std::string> lines;
    try
    {
        for (std::string line; std::getline(file, line);)
        {
            lines.push_back(std::move(line));
            line.clear();
        }
    }
    catch (const std::ios_base::failure &e)
    {
        throw LoadError(
            fmt::format("error while reading {}: {}", filename, e.what()));
    }
    if (file.bad())
    {
        throw LoadError(fmt::format("error while reading {}", filename));
    }
    return lines;
}

std::string read_contents(const std::string &filename)
{
    auto file = open_file(filename);
    std::string contents;
    try
    {
        contents.assign(std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>());
    }
    catch (const std::ios_base::failure &e)
    {
        // filebuf::underflow throws on read errors such as EISDIR
        throw LoadError(
            fmt::format("error while reading {}: {}", filename, e.what()));
    }
    if (file.bad())
    {
        throw LoadError(fmt::format("error while reading {}", filename));
    }
    return contents;
}
