#pragma once

/**
 * @file transfer_header.hpp
 * @brief The 4-byte header announcing the shape of a cartridge dump
 *
 * Wire layout (device to host):
 *   [0] marker     '=' (0x3D)
 *   [1] bank count  u8
 *   [2] bank size   u16 little-endian, low byte
 *   [3] bank size   high byte
 */

#include <array>
#include <cstdint>
#include <span>

namespace zealdump {

// Host to device: start sending the dump
constexpr uint8_t TRIGGER_BYTE = '!';

// First byte of every header
constexpr uint8_t HEADER_MARKER = '=';

struct TransferHeader {
    uint8_t marker = HEADER_MARKER;
    uint8_t bankCount = 0;
    uint16_t bankSize = 0;

    static constexpr size_t SERIALIZED_SIZE = 4;

    [[nodiscard]] bool hasValidMarker() const { return marker == HEADER_MARKER; }

    // bankCount * bankSize; at most 255 * 65535, always fits
    [[nodiscard]] uint32_t totalBytes() const {
        return static_cast<uint32_t>(bankCount) * static_cast<uint32_t>(bankSize);
    }

    // Decode exactly SERIALIZED_SIZE bytes. The marker is stored as received;
    // check hasValidMarker() before trusting the other fields.
    [[nodiscard]] static TransferHeader fromBytes(std::span<const uint8_t, SERIALIZED_SIZE> data);

    [[nodiscard]] std::array<uint8_t, SERIALIZED_SIZE> toBytes() const;

    constexpr bool operator==(const TransferHeader&) const = default;
};

}  // namespace zealdump
