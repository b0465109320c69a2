#pragma once

/**
 * @file byte_channel.hpp
 * @brief Duplex byte channel interface used by the dump protocol
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace zealdump {

// Outcome of a single timed read
struct ReadResult {
    size_t count = 0;     // Bytes placed in the buffer (may be less than requested)
    bool closed = false;  // Channel will never deliver more data
};

// ============================================================================
// ByteChannel - A configured duplex stream with a bounded read wait
// ============================================================================
//
// Reads wait at most the channel's own timeout. A read returning zero bytes
// with closed == false means the timeout elapsed with nothing received.
// Callers must not assume a read fills the whole buffer.
//
// The channel's lifecycle (open/close) belongs to whoever created it.
//
class ByteChannel {
public:
    virtual ~ByteChannel() = default;

    // Send a single byte. Returns false if the byte could not be sent.
    [[nodiscard]] virtual bool writeByte(uint8_t value) = 0;

    // Read up to buffer.size() bytes, waiting at most the channel timeout
    [[nodiscard]] virtual ReadResult read(std::span<uint8_t> buffer) = 0;

    // Description of the most recent failure (empty if none)
    [[nodiscard]] virtual std::string lastError() const { return {}; }
};

}  // namespace zealdump
