/**
 * @file zealdump.cpp
 * @brief Read and dump cartridge saves from Zeal 8-bit Computer to a file
 *
 * Run the dump program on the 8-bit computer first, then:
 *   ./zealdump -d /dev/ttyUSB0 -o save.sav
 */

#include <zealdump/dump_tool.hpp>

#include <iostream>
#include <string_view>
#include <vector>

int main(int argc, char* argv[]) {
    std::string_view program = argc > 0 ? argv[0] : "zealdump";
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return zealdump::runDumpTool(program, args, std::cout, std::cerr);
}
