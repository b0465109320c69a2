#pragma once

/**
 * @file file_sink.hpp
 * @brief Binary output file as a ByteSink
 */

#include "zealdump/core/byte_sink.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace zealdump {

// Creates (or truncates) the file on construction; throws std::runtime_error
// if it cannot be opened. Data is flushed on every write so that whatever
// was accepted is on disk even if a later step fails.
class FileSink : public ByteSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    // Non-copyable (owns file handle)
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool write(std::span<const uint8_t> data) override;
    [[nodiscard]] std::string lastError() const override { return lastError_; }

    // Flush and close; returns false if the final flush failed
    bool close();

    [[nodiscard]] bool isOpen() const { return file_.is_open(); }
    [[nodiscard]] uint64_t bytesWritten() const { return bytesWritten_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
    uint64_t bytesWritten_ = 0;
    std::string lastError_;
};

}  // namespace zealdump
