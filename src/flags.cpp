/*
  flags.cpp

  This file is part of den, Den Shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "flags.h"

#include <getopt.h>

#include <cstdlib>

#include "den.h"
#include "error_out.h"
#include "usage.h"

namespace flags {

namespace {

constexpr int kOptNoScriptCache = 256;
constexpr int kOptScriptCacheSize = 257;
constexpr int kOptMaxCallDepth = 258;
constexpr long kMaxCallDepthLimit = 64;

bool parse_size(const char* text, long min_value, long max_value, std::size_t& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* endptr = nullptr;
    long value = std::strtol(text, &endptr, 10);
    if (*endptr != '\0' || value < min_value || value > max_value) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

}  // namespace

ParseResult parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {
        {"command", required_argument, nullptr, 'c'},
        {"errexit", no_argument, nullptr, 'e'},
        {"noexec", no_argument, nullptr, 'n'},
        {"no-script-cache", no_argument, nullptr, kOptNoScriptCache},
        {"script-cache-size", required_argument, nullptr, kOptScriptCacheSize},
        {"max-call-depth", required_argument, nullptr, kOptMaxCallDepth},
        {"version", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    const char* short_options = "+c:envh";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config::execute_command = true;
                config::cmd_to_execute = optarg;
                break;
            case 'e':
                config::errexit = true;
                break;
            case 'n':
                config::noexec = true;
                break;
            case kOptNoScriptCache:
                config::script_cache_enabled = false;
                break;
            case kOptScriptCacheSize:
                if (!parse_size(optarg, 0, 4096, config::script_cache_capacity)) {
                    print_error({ErrorType::INVALID_ARGUMENT,
                                 "den",
                                 std::string("invalid script cache size: ") + optarg,
                                 {"Use a number between 0 and 4096"}});
                    result.exit_code = 2;
                    result.should_exit = true;
                    return result;
                }
                break;
            case kOptMaxCallDepth:
                if (!parse_size(optarg, 1, kMaxCallDepthLimit, config::max_call_depth)) {
                    print_error({ErrorType::INVALID_ARGUMENT,
                                 "den",
                                 std::string("invalid maximum call depth: ") + optarg,
                                 {"Use a number between 1 and 64"}});
                    result.exit_code = 2;
                    result.should_exit = true;
                    return result;
                }
                break;
            case 'v':
                config::show_version = true;
                break;
            case 'h':
                config::show_help = true;
                break;
            case '?':
                print_usage();
                result.exit_code = 127;
                result.should_exit = true;
                return result;
            default:
                print_error({ErrorType::INVALID_ARGUMENT,
                             std::string(1, static_cast<char>(c)),
                             "Unrecognized option",
                             {"Check command line arguments"}});
                result.exit_code = 127;
                result.should_exit = true;
                return result;
        }
    }

    if (optind < argc) {
        result.script_file = argv[optind];
        for (int i = optind + 1; i < argc; i++) {
            result.script_args.push_back(argv[i]);
        }
    }

    return result;
}

}  // namespace flags
