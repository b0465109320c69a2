#pragma once

/**
 * @file dump_session.hpp
 * @brief Trigger, header and bulk-payload exchange with the 8-bit computer
 */

#include "zealdump/core/byte_channel.hpp"
#include "zealdump/core/byte_sink.hpp"
#include "zealdump/core/transfer_header.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace zealdump {

// ============================================================================
// Result types
// ============================================================================

// Shape of a completed dump
struct DumpSummary {
    uint8_t bankCount = 0;
    uint16_t bankSize = 0;
    uint32_t totalBytes = 0;

    constexpr bool operator==(const DumpSummary&) const = default;
};

enum class DumpErrorKind : uint8_t {
    ChannelWrite,    // Trigger byte could not be sent
    ProtocolHeader,  // Header marker was not '='
    ShortRead,       // Channel ran dry before the expected byte count
    SinkWrite,       // Output destination rejected the data
};

[[nodiscard]] std::string_view toString(DumpErrorKind kind);

struct DumpError {
    DumpErrorKind kind = DumpErrorKind::ChannelWrite;

    uint8_t headerByte = 0;       // ProtocolHeader: the byte received instead of '='
    uint32_t expectedBytes = 0;   // ShortRead
    uint32_t receivedBytes = 0;   // ShortRead
    bool channelClosed = false;   // ShortRead: closed rather than timed out
    std::string detail;           // Text reported by the channel or sink, if any

    // Human readable message for the user
    [[nodiscard]] std::string describe() const;
};

// Exactly one of DumpSummary or DumpError
class DumpResult {
public:
    DumpResult(DumpSummary summary) : value_(summary) {}
    DumpResult(DumpError error) : value_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<DumpSummary>(value_); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_variant_access when called on the wrong alternative
    [[nodiscard]] const DumpSummary& summary() const { return std::get<DumpSummary>(value_); }
    [[nodiscard]] const DumpError& error() const { return std::get<DumpError>(value_); }

private:
    std::variant<DumpSummary, DumpError> value_;
};

// ============================================================================
// DumpSession - Drives one dump from trigger to written output
// ============================================================================
//
// Protocol:
//   1. send '!'
//   2. receive 4-byte TransferHeader, marker must be '='
//   3. receive bankCount * bankSize payload bytes
//   4. write the payload to the sink
//
// The payload is buffered and written in one piece once it is complete, so a
// failed transfer leaves the sink untouched. Each run() is one attempt; there
// are no retries. Single-threaded and blocking: every read waits at most the
// channel's timeout, and a zero-byte read or a closed channel ends the wait.
//
// Usage:
//   SerialPort port(serialConfig);
//   FileSink out(path);
//   DumpSession session;
//   session.setHeaderCallback([](const TransferHeader& h) { ... });
//   auto result = session.run(port, out);
//   if (!result) std::cerr << result.error().describe() << "\n";
//
class DumpSession {
public:
    enum class State : uint8_t {
        Idle,
        Triggered,
        HeaderReceived,
        Transferring,
        Writing,
        Done,
        Failed,
    };

    // Called once the header has validated, before the payload is read
    using HeaderCallback = std::function<void(const TransferHeader&)>;

    // Called after each payload fragment with (bytes received, bytes expected)
    using ProgressCallback = std::function<void(uint32_t, uint32_t)>;

    DumpSession() = default;

    void setHeaderCallback(HeaderCallback callback) { onHeader_ = std::move(callback); }
    void setProgressCallback(ProgressCallback callback) { onProgress_ = std::move(callback); }

    // Execute the full exchange once
    [[nodiscard]] DumpResult run(ByteChannel& channel, ByteSink& sink);

    // State reached by the most recent run()
    [[nodiscard]] State state() const { return state_; }

private:
    // Fill buffer from the channel across as many reads as it takes.
    // Returns the number of bytes collected; stops early only when a read
    // returns nothing or the channel reports closed.
    uint32_t readFully(ByteChannel& channel, std::span<uint8_t> buffer,
                       bool& closed, const ProgressCallback& progress);

    DumpResult fail(DumpError error);

    State state_ = State::Idle;
    HeaderCallback onHeader_;
    ProgressCallback onProgress_;
};

[[nodiscard]] std::string_view toString(DumpSession::State state);

}  // namespace zealdump
