#pragma once

#include <string>
#include <vector>

class Shell;

int source_command(const std::vector<std::string>& args, Shell* shell);
int eval_command(const std::vector<std::string>& args, Shell* shell);
