#pragma once

/**
 * @file byte_sink.hpp
 * @brief Sequential output destination for dumped data
 */

#include <cstdint>
#include <span>
#include <string>

namespace zealdump {

// A writable destination that only needs sequential writes (no seeking).
// Opened before a dump starts and closed by its owner afterwards.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Append data. Returns false if the destination rejected or truncated it.
    [[nodiscard]] virtual bool write(std::span<const uint8_t> data) = 0;

    // Description of the most recent failure (empty if none)
    [[nodiscard]] virtual std::string lastError() const { return {}; }
};

}  // namespace zealdump
