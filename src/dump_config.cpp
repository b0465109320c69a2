#include "zealdump/dump_config.hpp"

#include <charconv>
#include <climits>

namespace zealdump {

namespace {

// Positive integer no larger than maxValue, whole string consumed
std::optional<uint32_t> parsePositive(std::string_view text, uint32_t maxValue) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (value == 0 || value > maxValue) {
        return std::nullopt;
    }
    return value;
}

// poll() takes an int timeout
constexpr uint32_t MAX_TIMEOUT_MS = INT_MAX;

std::string badValue(const ConfigEntry& entry) {
    return "config line " + std::to_string(entry.line) + ": invalid " + entry.key +
           " '" + std::string(entry.value.asString()) + "'";
}

}  // namespace

// ============================================================================
// DumpConfig
// ============================================================================

std::optional<std::string> DumpConfig::apply(const ConfigDocument& doc) {
    devicePath = std::string(doc.getString("device", devicePath));
    outputPath = std::string(doc.getString("output", outputPath.string()));
    if (auto* entry = doc.get("baud")) {
        auto value = entry->value.asInteger();
        if (!value || *value <= 0 || *value > UINT32_MAX) {
            return badValue(*entry);
        }
        baudRate = static_cast<uint32_t>(*value);
    }
    if (auto* entry = doc.get("timeout_ms")) {
        auto value = entry->value.asInteger();
        if (!value || *value <= 0 || *value > MAX_TIMEOUT_MS) {
            return badValue(*entry);
        }
        readTimeout = std::chrono::milliseconds(*value);
    }
    if (auto* entry = doc.get("verbose")) {
        // Pick a default each way: an unrecognised word differs between the two
        bool asTrue = entry->value.asBool(true);
        bool asFalse = entry->value.asBool(false);
        if (asTrue != asFalse) {
            return badValue(*entry);
        }
        verbose = asTrue;
    }
    return std::nullopt;
}

// ============================================================================
// Command line
// ============================================================================

CommandLine parseCommandLine(const std::vector<std::string_view>& args, const ConfigParser& parser) {
    CommandLine result;

    auto fail = [&result](std::string message) {
        result.status = CommandLine::Status::Error;
        result.error = std::move(message);
        return result;
    };

    std::optional<std::string_view> device, output, baud, timeout, configPath;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.status = CommandLine::Status::Help;
            return result;
        }
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
            continue;
        }

        std::optional<std::string_view>* target = nullptr;
        if (arg == "-o") target = &output;
        else if (arg == "-d") target = &device;
        else if (arg == "-b") target = &baud;
        else if (arg == "-t") target = &timeout;
        else if (arg == "-c") target = &configPath;

        if (!target) {
            return fail("unknown option: " + std::string(arg));
        }
        if (i + 1 >= args.size()) {
            return fail("option " + std::string(arg) + " requires a value");
        }
        *target = args[++i];
    }

    DumpConfig& config = result.config;

    if (configPath) {
        auto doc = parser.parseFile(std::string(*configPath));
        if (!doc) {
            return fail("cannot read config file: " + std::string(*configPath));
        }
        if (auto error = config.apply(*doc)) {
            return fail(std::string(*configPath) + ": " + *error);
        }
    }

    if (device) config.devicePath = std::string(*device);
    if (output) config.outputPath = std::string(*output);
    if (verbose) config.verbose = true;

    if (baud) {
        auto value = parsePositive(*baud, UINT32_MAX);
        if (!value) {
            return fail("invalid baud rate: " + std::string(*baud));
        }
        config.baudRate = *value;
    }
    if (timeout) {
        auto value = parsePositive(*timeout, MAX_TIMEOUT_MS);
        if (!value) {
            return fail("invalid timeout: " + std::string(*timeout));
        }
        config.readTimeout = std::chrono::milliseconds(*value);
    }

    if (config.devicePath.empty()) {
        return fail("missing required option -d (UART device node)");
    }
    if (config.outputPath.empty()) {
        return fail("missing required option -o (output save file)");
    }

    return result;
}

std::string usage(std::string_view program) {
    std::string text = "usage: ";
    text += program;
    text += " -o OUTFILE -d TTYNODE [-b BAUDRATE] [-t TIMEOUT_MS] [-c CONFIG] [-v]\n"
            "\n"
            "Read and dump cartridge saves from Zeal 8-bit Computer to a file\n"
            "\n"
            "options:\n"
            "  -o OUTFILE     Output save file name\n"
            "  -d TTYNODE     UART device node, e.g. /dev/ttyUSB0\n"
            "  -b BAUDRATE    Baudrate to use with the serial node (default 57600)\n"
            "  -t TIMEOUT_MS  Give up after this much silence on the line (default 1000)\n"
            "  -c CONFIG      Read defaults from a config file\n"
            "  -v, --verbose  Enable verbose mode\n"
            "  -h, --help     Show this help message\n";
    return text;
}

}  // namespace zealdump
