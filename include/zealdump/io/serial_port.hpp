#pragma once

/**
 * @file serial_port.hpp
 * @brief POSIX serial device as a ByteChannel
 */

#include "zealdump/core/byte_channel.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace zealdump {

constexpr uint32_t DEFAULT_BAUD_RATE = 57600;

// Roughly one second of silence before a read gives up
constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{1000};

struct SerialConfig {
    std::string device;                  // e.g. /dev/ttyUSB0
    uint32_t baudRate = DEFAULT_BAUD_RATE;
    std::chrono::milliseconds readTimeout = DEFAULT_READ_TIMEOUT;
};

// ============================================================================
// SerialPort - termios UART in raw 8N1 mode
// ============================================================================
//
// Opening configures the line immediately; any failure (missing node,
// permission denied, not a terminal, unsupported rate) throws
// std::runtime_error so that nothing is sent on a half-configured port.
//
// read() waits with poll() for at most readTimeout. A hang-up (EOF, EIO,
// POLLHUP) or a close() marks the channel closed.
//
class SerialPort : public ByteChannel {
public:
    explicit SerialPort(SerialConfig config);
    ~SerialPort() override;

    // Non-copyable, non-movable (owns the file descriptor)
    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;
    SerialPort(SerialPort&&) = delete;
    SerialPort& operator=(SerialPort&&) = delete;

    [[nodiscard]] bool writeByte(uint8_t value) override;
    [[nodiscard]] ReadResult read(std::span<uint8_t> buffer) override;
    [[nodiscard]] std::string lastError() const override { return lastError_; }

    // Release the device; later reads report closed
    void close();

    [[nodiscard]] bool isOpen() const { return fd_ >= 0; }
    [[nodiscard]] int nativeHandle() const { return fd_; }
    [[nodiscard]] const SerialConfig& config() const { return config_; }

    // True if termios has a standard speed constant for this rate
    [[nodiscard]] static bool isSupportedBaudRate(uint32_t baudRate);

private:
    void configureLine();
    void recordError(const char* what, int err);

    SerialConfig config_;
    int fd_ = -1;
    std::string lastError_;
};

}  // namespace zealdump
