#pragma once

#include <string>
#include <vector>

// test EXPR and [ EXPR ].
int test_command(const std::vector<std::string>& args);
