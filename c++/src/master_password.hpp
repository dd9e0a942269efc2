#pragma once

#include <string>

bool is_accessible_only_by_owner(const std::string &filename);

std::string load_master_password(const std::string &filename);
