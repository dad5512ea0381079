#pragma once

void print_usage();
void print_version();
