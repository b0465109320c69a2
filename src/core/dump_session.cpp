#include "zealdump/core/dump_session.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <vector>

namespace zealdump {

// ============================================================================
// Names and messages
// ============================================================================

std::string_view toString(DumpErrorKind kind) {
    switch (kind) {
        case DumpErrorKind::ChannelWrite:   return "ChannelWriteError";
        case DumpErrorKind::ProtocolHeader: return "ProtocolHeaderError";
        case DumpErrorKind::ShortRead:      return "ShortReadError";
        case DumpErrorKind::SinkWrite:      return "SinkWriteError";
    }
    return "UnknownError";
}

std::string_view toString(DumpSession::State state) {
    switch (state) {
        case DumpSession::State::Idle:           return "Idle";
        case DumpSession::State::Triggered:      return "Triggered";
        case DumpSession::State::HeaderReceived: return "HeaderReceived";
        case DumpSession::State::Transferring:   return "Transferring";
        case DumpSession::State::Writing:        return "Writing";
        case DumpSession::State::Done:           return "Done";
        case DumpSession::State::Failed:         return "Failed";
    }
    return "Unknown";
}

std::string DumpError::describe() const {
    std::string message;
    switch (kind) {
        case DumpErrorKind::ChannelWrite:
            message = "Failed to send the dump request to the 8-bit computer";
            break;
        case DumpErrorKind::ProtocolHeader: {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02x", headerByte);
            message = "Invalid message header from the 8-bit computer: ";
            message += hex;
            break;
        }
        case DumpErrorKind::ShortRead:
            message = "Received " + std::to_string(receivedBytes) + " of " +
                      std::to_string(expectedBytes) + " expected bytes before the channel " +
                      (channelClosed ? "closed" : "timed out");
            break;
        case DumpErrorKind::SinkWrite:
            message = "Failed to write the dump to the output";
            break;
    }
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    return message;
}

// ============================================================================
// DumpSession
// ============================================================================

DumpResult DumpSession::run(ByteChannel& channel, ByteSink& sink) {
    state_ = State::Idle;

    // Idle -> Triggered
    if (!channel.writeByte(TRIGGER_BYTE)) {
        DumpError error;
        error.kind = DumpErrorKind::ChannelWrite;
        error.detail = channel.lastError();
        return fail(std::move(error));
    }
    state_ = State::Triggered;

    // Triggered -> HeaderReceived
    std::array<uint8_t, TransferHeader::SERIALIZED_SIZE> headerBytes{};
    bool closed = false;
    uint32_t got = readFully(channel, headerBytes, closed, nullptr);
    if (got < headerBytes.size()) {
        DumpError error;
        error.kind = DumpErrorKind::ShortRead;
        error.expectedBytes = static_cast<uint32_t>(headerBytes.size());
        error.receivedBytes = got;
        error.channelClosed = closed;
        error.detail = channel.lastError();
        return fail(std::move(error));
    }

    TransferHeader header = TransferHeader::fromBytes(headerBytes);
    if (!header.hasValidMarker()) {
        DumpError error;
        error.kind = DumpErrorKind::ProtocolHeader;
        error.headerByte = header.marker;
        return fail(std::move(error));
    }
    state_ = State::HeaderReceived;

    if (onHeader_) {
        onHeader_(header);
    }

    // HeaderReceived -> Transferring
    state_ = State::Transferring;
    const uint32_t total = header.totalBytes();
    std::vector<uint8_t> payload(total);
    got = readFully(channel, payload, closed, onProgress_);
    if (got < total) {
        DumpError error;
        error.kind = DumpErrorKind::ShortRead;
        error.expectedBytes = total;
        error.receivedBytes = got;
        error.channelClosed = closed;
        error.detail = channel.lastError();
        return fail(std::move(error));
    }

    // Transferring -> Writing
    state_ = State::Writing;
    if (!sink.write(payload)) {
        DumpError error;
        error.kind = DumpErrorKind::SinkWrite;
        error.detail = sink.lastError();
        return fail(std::move(error));
    }

    state_ = State::Done;
    return DumpSummary{header.bankCount, header.bankSize, total};
}

uint32_t DumpSession::readFully(ByteChannel& channel, std::span<uint8_t> buffer,
                                bool& closed, const ProgressCallback& progress) {
    size_t got = 0;
    closed = false;

    while (got < buffer.size()) {
        ReadResult r = channel.read(buffer.subspan(got));
        // Clamp: a channel may over-report
        got += std::min(r.count, buffer.size() - got);

        if (r.count > 0 && progress) {
            progress(static_cast<uint32_t>(got), static_cast<uint32_t>(buffer.size()));
        }
        if (r.closed) {
            closed = true;
            break;
        }
        if (r.count == 0) {
            break;  // Timed out with nothing new
        }
    }

    return static_cast<uint32_t>(got);
}

DumpResult DumpSession::fail(DumpError error) {
    state_ = State::Failed;
    return error;
}

}  // namespace zealdump
