//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageFramer.cpp
// Purpose: Content-Length and line-delimited JSON framer plus the per-channel stream decoder
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <system_error>

#include "logging/Logger.h"
#include "mcpio/MessageFramer.h"

namespace mcpio {

const char* wireModeName(WireMode mode) {
    switch (mode) {
        case WireMode::HeaderFramed: return "header-framed";
        case WireMode::LineDelimited: return "line-delimited";
        default: return "unknown";
    }
}

const char* decodeStatusName(IMessageFramer::DecodeStatus status) {
    using S = IMessageFramer::DecodeStatus;
    switch (status) {
        case S::Ok: return "Ok";
        case S::NeedMoreData: return "NeedMoreData";
        case S::Resync: return "Resync";
        case S::Unrecoverable: return "Unrecoverable";
        case S::InvalidHeader: return "InvalidHeader";
        case S::BodyTooLarge: return "BodyTooLarge";
        case S::InvalidJson: return "InvalidJson";
    }
    return "Unknown";
}

namespace {
constexpr std::string_view kHeaderName = "content-length:";
constexpr std::string_view kHeaderSep = "\r\n\r\n";

bool isLeadingSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool ciEqual(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

enum class PrefixMatch { Full, Partial, None };

// Compares the start of text against the lowercase needle, case-insensitively.
PrefixMatch matchHeaderPrefix(std::string_view text) {
    const std::size_t n = std::min(text.size(), kHeaderName.size());
    for (std::size_t k = 0; k < n; ++k) {
        if (!ciEqual(text[k], kHeaderName[k])) {
            return PrefixMatch::None;
        }
    }
    return n == kHeaderName.size() ? PrefixMatch::Full : PrefixMatch::Partial;
}

std::size_t ciFind(std::string_view text, std::string_view needle, std::size_t from) {
    if (needle.size() > text.size()) {
        return std::string_view::npos;
    }
    for (std::size_t i = from; i + needle.size() <= text.size(); ++i) {
        std::size_t k = 0;
        while (k < needle.size() && ciEqual(text[i + k], needle[k])) ++k;
        if (k == needle.size()) return i;
    }
    return std::string_view::npos;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<JSONValue> parseObject(std::string_view text, std::string& error) {
    try {
        JSONValue v = ParseJSON(std::string(text));
        if (!v.isObject()) {
            error = "top-level JSON value is not an object";
            return std::nullopt;
        }
        return v;
    } catch (const std::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

class DualModeFramer : public IMessageFramer {
public:
    explicit DualModeFramer(std::size_t maxLen) : maxBufferSize(maxLen) {}

    std::string encode(const JSONValue& message) override {
        const std::string body = SerializeJSON(message);
        std::string frame = std::format("Content-Length: {}\r\n\r\n", body.size());
        frame.append(body);
        return frame;
    }

    DecodeResult tryReadOne(std::string_view buffer) override {
        std::size_t start = 0;
        while (start < buffer.size() && isLeadingSpace(buffer[start])) ++start;
        if (start == buffer.size()) {
            return { DecodeStatus::NeedMoreData, WireMode::Unknown, std::nullopt, start, {} };
        }

        const std::string_view rest = buffer.substr(start);
        switch (matchHeaderPrefix(rest)) {
            case PrefixMatch::Full:
                return readHeaderFramed(buffer, start);
            case PrefixMatch::Partial:
                // "Content-Le" split across reads
                return { DecodeStatus::NeedMoreData, WireMode::HeaderFramed, std::nullopt, start, {} };
            case PrefixMatch::None:
                break;
        }
        if (rest.front() == '{') {
            return readLineDelimited(buffer, start);
        }
        return resync(buffer, start);
    }

private:
    DecodeResult readHeaderFramed(std::string_view buffer, std::size_t start) {
        const std::size_t headerEnd = buffer.find(kHeaderSep, start);
        if (headerEnd == std::string_view::npos) {
            return { DecodeStatus::NeedMoreData, WireMode::HeaderFramed, std::nullopt, start, {} };
        }
        const std::size_t headerAndSep = headerEnd + kHeaderSep.size();

        std::optional<std::string_view> lengthValue;
        std::string_view headers = buffer.substr(start, headerEnd - start);
        while (!headers.empty()) {
            const std::size_t eol = headers.find("\r\n");
            std::string_view line = headers.substr(0, eol);
            headers = (eol == std::string_view::npos) ? std::string_view{} : headers.substr(eol + 2);
            const std::size_t colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            if (matchHeaderPrefix(line.substr(0, colon + 1)) == PrefixMatch::Full) {
                lengthValue = trim(line.substr(colon + 1));
                break;
            }
        }

        if (!lengthValue.has_value()) {
            return { DecodeStatus::InvalidHeader, WireMode::HeaderFramed, std::nullopt, headerAndSep,
                     "missing Content-Length header" };
        }
        const std::string_view value = lengthValue.value();
        const bool allDigits = !value.empty() &&
            std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; });
        if (!allDigits) {
            return { DecodeStatus::InvalidHeader, WireMode::HeaderFramed, std::nullopt, headerAndSep,
                     std::format("invalid Content-Length value '{}'", value) };
        }
        uint64_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec == std::errc::result_out_of_range || length > maxBufferSize) {
            return { DecodeStatus::BodyTooLarge, WireMode::HeaderFramed, std::nullopt, headerAndSep,
                     std::format("Content-Length {} exceeds limit {}", value, maxBufferSize) };
        }

        const std::size_t frameEnd = headerAndSep + static_cast<std::size_t>(length);
        if (buffer.size() < frameEnd) {
            return { DecodeStatus::NeedMoreData, WireMode::HeaderFramed, std::nullopt, start, {} };
        }

        std::string error;
        auto message = parseObject(buffer.substr(headerAndSep, static_cast<std::size_t>(length)), error);
        if (!message.has_value()) {
            return { DecodeStatus::InvalidJson, WireMode::HeaderFramed, std::nullopt, frameEnd,
                     std::format("invalid JSON body: {}", error) };
        }
        return { DecodeStatus::Ok, WireMode::HeaderFramed, std::move(message), frameEnd, {} };
    }

    DecodeResult readLineDelimited(std::string_view buffer, std::size_t start) {
        int depth = 0;
        bool inString = false;
        bool escaped = false;
        std::size_t end = std::string_view::npos;
        for (std::size_t j = start; j < buffer.size(); ++j) {
            const char c = buffer[j];
            if (inString) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    inString = false;
                }
                continue;
            }
            if (c == '"') {
                inString = true;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    end = j;
                    break;
                }
            }
        }
        if (end == std::string_view::npos) {
            return { DecodeStatus::NeedMoreData, WireMode::LineDelimited, std::nullopt, start, {} };
        }

        std::string error;
        auto message = parseObject(buffer.substr(start, end + 1 - start), error);
        if (!message.has_value()) {
            return { DecodeStatus::InvalidJson, WireMode::LineDelimited, std::nullopt, end + 1,
                     std::format("invalid JSON span: {}", error) };
        }
        return { DecodeStatus::Ok, WireMode::LineDelimited, std::move(message), end + 1, {} };
    }

    // Drops bytes up to the next '{' or Content-Length header. A trailing partial header is kept.
    DecodeResult resync(std::string_view buffer, std::size_t start) {
        const std::size_t from = start + 1;
        std::size_t next = std::min(buffer.find('{', from), ciFind(buffer, kHeaderName, from));
        if (next == std::string_view::npos) {
            const std::size_t maxTail = std::min(kHeaderName.size() - 1, buffer.size() - from);
            for (std::size_t k = maxTail; k > 0; --k) {
                if (matchHeaderPrefix(buffer.substr(buffer.size() - k)) == PrefixMatch::Partial) {
                    next = buffer.size() - k;
                    break;
                }
            }
        }
        if (next == std::string_view::npos) {
            return { DecodeStatus::Unrecoverable, WireMode::Unknown, std::nullopt, buffer.size(),
                     "no message start found" };
        }
        return { DecodeStatus::Resync, WireMode::Unknown, std::nullopt, next,
                 std::format("skipped {} bytes of noise", next - start) };
    }

    std::size_t maxBufferSize;
};
} // namespace

std::unique_ptr<IMessageFramer> MakeMessageFramer(std::size_t maxBufferSize) {
    return std::make_unique<DualModeFramer>(maxBufferSize);
}

//--------------------------------------------------------------------------------------------------------
// StreamDecoder
//--------------------------------------------------------------------------------------------------------
StreamDecoder::StreamDecoder(std::size_t maxBufferSize)
    : framer(MakeMessageFramer(maxBufferSize)), maxBufferSize(maxBufferSize) {}

void StreamDecoder::Reset() {
    ++resets;
    buffer.clear();
    buffer.shrink_to_fit();
}

std::size_t StreamDecoder::Feed(const char* data, std::size_t size) {
    if (size > maxBufferSize || buffer.size() > maxBufferSize - size) {
        LOG_ERROR("Decode buffer ceiling exceeded (buffered={}, incoming={}, max={}); resetting",
                  buffer.size(), size, maxBufferSize);
        Reset();
        if (onError) {
            onError(errors::EngineError{errors::ErrorClass::ResourceExhaustion,
                std::format("buffer would exceed {} bytes; incoming chunk of {} bytes dropped", maxBufferSize, size)});
        }
        return 0;
    }
    buffer.append(data, size);

    const uint64_t generation = resets;
    std::size_t delivered = 0;
    std::size_t offset = 0;
    while (offset < buffer.size()) {
        auto r = framer->tryReadOne(std::string_view(buffer).substr(offset));
        offset += r.bytesConsumed;
        if (r.status == IMessageFramer::DecodeStatus::NeedMoreData) {
            break;
        }
        switch (r.status) {
            case IMessageFramer::DecodeStatus::Ok:
                ++delivered;
                if (onMessage) {
                    onMessage(std::move(r.message.value()), r.mode);
                }
                break;
            case IMessageFramer::DecodeStatus::Resync:
            case IMessageFramer::DecodeStatus::Unrecoverable:
                LOG_WARN("Framer {}: {}", decodeStatusName(r.status), r.error);
                break;
            default:
                LOG_WARN("Framing error ({}, {}): {}", decodeStatusName(r.status), wireModeName(r.mode), r.error);
                if (onError) {
                    onError(errors::EngineError{errors::ErrorClass::Framing, r.error});
                }
                break;
        }
        if (resets != generation) {
            // A callback reset the decoder; the scanned bytes are already gone
            return delivered;
        }
        if (r.bytesConsumed == 0) {
            break;
        }
    }
    buffer.erase(0, offset);
    return delivered;
}

} // namespace mcpio
