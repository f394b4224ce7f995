//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFramer.h
// Purpose: Dual-format message framing for MCP stdio servers (Content-Length headers and bare JSON)
//========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "mcpio/JSONRPCTypes.h"
#include "mcpio/errors/Errors.h"

namespace mcpio {

// Default ceiling for buffered, not-yet-decoded bytes (100 MiB)
constexpr std::size_t DEFAULT_MAX_BUFFER_SIZE = 100 * 1024 * 1024;

//========================================================================================================
// WireMode
// Purpose: Format of one decoded message. Re-evaluated for every message because some servers mix
//          header-framed and line-delimited output on the same stream.
//========================================================================================================
enum class WireMode {
    Unknown,
    HeaderFramed,
    LineDelimited
};

const char* wireModeName(WireMode mode);

//========================================================================================================
// IMessageFramer
// Purpose: Pure byte-buffer codec. encode() always emits the header-framed form; tryReadOne() accepts
//          either form and never mutates the caller's buffer.
//
// DecodeStatus:
//   Ok            - message holds one decoded JSON object.
//   NeedMoreData  - no complete message yet; bytesConsumed covers only stripped leading whitespace.
//   Resync        - leading noise dropped up to the next candidate message start.
//   Unrecoverable - the whole buffer was noise and is consumed.
//   InvalidHeader - header block without a usable Content-Length; header block consumed.
//   BodyTooLarge  - declared length above the buffer ceiling; header block consumed.
//   InvalidJson   - a complete frame or brace span that is not a JSON object; span consumed.
//========================================================================================================
class IMessageFramer {
public:
    virtual ~IMessageFramer() = default;
    enum class DecodeStatus {
        Ok,
        NeedMoreData,
        Resync,
        Unrecoverable,
        InvalidHeader,
        BodyTooLarge,
        InvalidJson
    };
    struct DecodeResult {
        DecodeStatus status{DecodeStatus::NeedMoreData};
        WireMode mode{WireMode::Unknown};
        std::optional<JSONValue> message;   // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes the caller must drop from the front of its buffer
        std::string error;                  // detail for the error statuses
    };
    virtual std::string encode(const JSONValue& message) = 0;
    virtual DecodeResult tryReadOne(std::string_view buffer) = 0;
};

const char* decodeStatusName(IMessageFramer::DecodeStatus status);

std::unique_ptr<IMessageFramer> MakeMessageFramer(std::size_t maxBufferSize = DEFAULT_MAX_BUFFER_SIZE);

//========================================================================================================
// StreamDecoder
// Purpose: Owns the byte buffer of one channel and runs the framer until it needs more data.
//          Messages and framing errors are delivered in stream order on the feeding thread.
// Notes:
//   Not thread-safe; one decode loop per channel.
//   When buffered + incoming bytes would exceed maxBufferSize the buffer is reset, the incoming chunk
//   is dropped and exactly one ResourceExhaustion error is reported.
//========================================================================================================
class StreamDecoder {
public:
    using MessageCallback = std::function<void(JSONValue message, WireMode mode)>;
    using ErrorCallback = std::function<void(const errors::EngineError& error)>;

    explicit StreamDecoder(std::size_t maxBufferSize = DEFAULT_MAX_BUFFER_SIZE);

    void SetMessageCallback(MessageCallback cb) { onMessage = std::move(cb); }
    void SetErrorCallback(ErrorCallback cb) { onError = std::move(cb); }

    // Appends bytes and decodes every complete message. Returns the number of messages delivered.
    std::size_t Feed(const char* data, std::size_t size);
    std::size_t Feed(std::string_view data) { return Feed(data.data(), data.size()); }

    void Reset();
    std::size_t BufferedBytes() const { return buffer.size(); }
    std::size_t MaxBufferSize() const { return maxBufferSize; }

private:
    std::unique_ptr<IMessageFramer> framer;
    std::string buffer;
    std::size_t maxBufferSize;
    uint64_t resets{0};
    MessageCallback onMessage;
    ErrorCallback onError;
};

} // namespace mcpio
