#pragma once

#include <string>
#include <vector>

class Shell;

int break_command(const std::vector<std::string>& args, Shell* shell);
int continue_command(const std::vector<std::string>& args, Shell* shell);
int return_command(const std::vector<std::string>& args, Shell* shell);
