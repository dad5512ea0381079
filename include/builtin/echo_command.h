#pragma once

#include <string>
#include <vector>

int echo_command(const std::vector<std::string>& args);
