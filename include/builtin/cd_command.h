#pragma once

#include <string>
#include <vector>

class Shell;

int cd_command(const std::vector<std::string>& args, Shell* shell);
