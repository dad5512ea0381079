#pragma once

#include <string>
#include <vector>

class Shell;

// Only the ERR and EXIT pseudo-signals are trappable.
int trap_command(const std::vector<std::string>& args, Shell* shell);
