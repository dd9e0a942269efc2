#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Raised when a site list or master password file cannot be read.
class LoadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

void trim(std::string &s);

std::vector<std::string> read_lines(const std::string &filename);
std::string read_contents(const std::string &filename);
