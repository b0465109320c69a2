#pragma once

/**
 * @file dump_config.hpp
 * @brief Settings for one zealdump run: defaults, config file, command line
 */

#include "zealdump/core/config_parser.hpp"
#include "zealdump/io/serial_port.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zealdump {

// Everything the tool needs before it touches the device
struct DumpConfig {
    std::string devicePath;
    std::filesystem::path outputPath;
    uint32_t baudRate = DEFAULT_BAUD_RATE;
    std::chrono::milliseconds readTimeout = DEFAULT_READ_TIMEOUT;
    bool verbose = false;

    [[nodiscard]] SerialConfig serialConfig() const {
        return SerialConfig{devicePath, baudRate, readTimeout};
    }

    // Overlay values from a config file. Recognised keys:
    //   device, output, baud, timeout_ms, verbose
    // Unknown keys are ignored. Returns an error message for a malformed value.
    [[nodiscard]] std::optional<std::string> apply(const ConfigDocument& doc);
};

struct CommandLine {
    enum class Status {
        Ok,     // config is complete and valid
        Help,   // -h / --help given
        Error,  // error describes what is wrong
    };

    Status status = Status::Ok;
    DumpConfig config;
    std::string error;
};

/**
 * @brief Parse the tool's arguments (without the program name)
 *
 * Options:
 *   -o FILE        output save file (required)
 *   -d NODE        UART device node (required)
 *   -b BAUD        baud rate (default 57600)
 *   -t MS          read timeout in milliseconds (default 1000)
 *   -c FILE        config file supplying defaults for the above
 *   -v, --verbose  verbose output
 *   -h, --help     usage
 *
 * Precedence: built-in defaults, then the -c file, then explicit options.
 */
[[nodiscard]] CommandLine parseCommandLine(const std::vector<std::string_view>& args,
                                           const ConfigParser& parser = ConfigParser{});

[[nodiscard]] std::string usage(std::string_view program);

}  // namespace zealdump
