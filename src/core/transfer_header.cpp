#include "zealdump/core/transfer_header.hpp"

namespace zealdump {

TransferHeader TransferHeader::fromBytes(std::span<const uint8_t, SERIALIZED_SIZE> data) {
    TransferHeader header;
    header.marker = data[0];
    header.bankCount = data[1];
    header.bankSize = static_cast<uint16_t>(data[2] | (data[3] << 8));
    return header;
}

std::array<uint8_t, TransferHeader::SERIALIZED_SIZE> TransferHeader::toBytes() const {
    return {
        marker,
        bankCount,
        static_cast<uint8_t>(bankSize & 0xFF),
        static_cast<uint8_t>((bankSize >> 8) & 0xFF)
    };
}

}  // namespace zealdump
