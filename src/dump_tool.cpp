#include "zealdump/dump_tool.hpp"
#include "zealdump/core/dump_session.hpp"
#include "zealdump/dump_config.hpp"
#include "zealdump/io/file_sink.hpp"
#include "zealdump/io/serial_port.hpp"

#include <exception>
#include <memory>

namespace zealdump {

int runDumpTool(std::string_view program, const std::vector<std::string_view>& args,
                std::ostream& out, std::ostream& err) {
    CommandLine cli = parseCommandLine(args);
    switch (cli.status) {
        case CommandLine::Status::Help:
            out << usage(program);
            return EXIT_DUMPED;
        case CommandLine::Status::Error:
            err << "[zealdump] ERROR: " << cli.error << "\n" << usage(program);
            return EXIT_USAGE;
        case CommandLine::Status::Ok:
            break;
    }

    const DumpConfig& config = cli.config;
    if (config.verbose) {
        out << "Connecting to " << config.devicePath
            << " with baudrate " << config.baudRate << "\n";
    }

    std::unique_ptr<SerialPort> port;
    std::unique_ptr<FileSink> output;
    try {
        port = std::make_unique<SerialPort>(config.serialConfig());
        output = std::make_unique<FileSink>(config.outputPath);
    } catch (const std::exception& e) {
        err << "[zealdump] ERROR: " << e.what() << "\n";
        return EXIT_FAILED;
    }

    DumpSession session;
    session.setHeaderCallback([&out](const TransferHeader& header) {
        out << "Dumping " << static_cast<unsigned>(header.bankCount) << " banks of "
            << header.bankSize << " bytes, " << header.totalBytes()
            << " bytes in total..." << std::endl;
    });
    if (config.verbose) {
        session.setProgressCallback([&out](uint32_t received, uint32_t total) {
            out << "  received " << received << " / " << total << " bytes\n";
        });
    }

    DumpResult result = session.run(*port, *output);
    port->close();

    if (!result) {
        err << "[zealdump] ERROR: " << result.error().describe() << "\n";
        if (config.verbose) {
            err << "[zealdump] failed with " << toString(result.error().kind)
                << ", " << output->bytesWritten() << " bytes left in "
                << output->path() << "\n";
        }
        return EXIT_FAILED;
    }

    if (!output->close()) {
        err << "[zealdump] ERROR: " << output->lastError() << "\n";
        return EXIT_FAILED;
    }

    out << config.outputPath.string() << " successfully dumped\n";
    return EXIT_DUMPED;
}

}  // namespace zealdump
