#pragma once

/**
 * @file dump_tool.hpp
 * @brief The zealdump command: options in, dump file and status lines out
 */

#include <ostream>
#include <string_view>
#include <vector>

namespace zealdump {

constexpr int EXIT_DUMPED = 0;
constexpr int EXIT_FAILED = 1;  // device, output or protocol failure
constexpr int EXIT_USAGE = 2;   // bad command line

/**
 * @brief Run one dump from start to finish
 *
 * Status lines go to out, errors and usage text to err. On failure the
 * output file is left as it is.
 *
 * @param program Name shown in the usage text
 * @param args Arguments without the program name
 * @return Process exit code
 */
int runDumpTool(std::string_view program, const std::vector<std::string_view>& args,
                std::ostream& out, std::ostream& err);

}  // namespace zealdump
