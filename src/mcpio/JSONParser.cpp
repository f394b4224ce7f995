//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Strict JSON parser/serializer and JSON-RPC message conversions using only the std library
//==========================================================================================================

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include "mcpio/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace mcpio {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.value);
        if constexpr (std::is_same_v<T, JSONValue::Array>) {
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!lhs[i] || !rhs[i]) {
                    if (lhs[i] != rhs[i]) return false;
                    continue;
                }
                if (*lhs[i] != *rhs[i]) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (const auto& [key, val] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end()) return false;
                if (!val || !it->second) {
                    if (val != it->second) return false;
                    continue;
                }
                if (*val != *it->second) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else {
            return lhs == rhs;
        }
    }, a.value);
}

// -------------------------------
// Recursive descent JSON parser
// -------------------------------
namespace {
constexpr int MaxNestingDepth = 512;

void appendUtf8(std::string& out, uint32_t code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    uint32_t parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        uint32_t code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') code += static_cast<uint32_t>(10 + (h - 'a'));
            else if (h >= 'A' && h <= 'F') code += static_cast<uint32_t>(10 + (h - 'A'));
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected string");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("truncated escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired high surrogate");
                        i += 2;
                        uint32_t low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired low surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        const std::size_t start = i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size()) fail("truncated number");
        if (s[i] == '0') {
            ++i;
        } else if (s[i] >= '1' && s[i] <= '9') {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        } else {
            fail("invalid value");
        }
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("expected digit after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("expected exponent digits");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Integers beyond int64 degrade to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc() || ptr != last) fail("number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{' || c == '[') {
            if (++depth > MaxNestingDepth) fail("nesting too deep");
            JSONValue v = (c == '{') ? parseObject() : parseArray();
            --depth;
            return v;
        }
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                out += "null";
                return;
            }
            std::string num = std::format("{}", v);
            // Keep the value a double on re-parse
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            out += num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (v[i]) serializeInto(out, *v[i]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, key);
                out.push_back(':');
                if (val) serializeInto(out, *val); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing data after document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    if (!object.isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> GetStringMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<std::string>(v->value)) {
        return std::get<std::string>(v->value);
    }
    return std::nullopt;
}

std::optional<int64_t> GetIntMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<int64_t>(v->value)) {
        return std::get<int64_t>(v->value);
    }
    return std::nullopt;
}

std::optional<double> GetNumberMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (!v) {
        return std::nullopt;
    }
    if (std::holds_alternative<double>(v->value)) {
        return std::get<double>(v->value);
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return static_cast<double>(std::get<int64_t>(v->value));
    }
    return std::nullopt;
}

std::optional<bool> GetBoolMember(const JSONValue& object, const std::string& key) {
    const JSONValue* v = FindMember(object, key);
    if (v && std::holds_alternative<bool>(v->value)) {
        return std::get<bool>(v->value);
    }
    return std::nullopt;
}

//----------------------------------------------------------------------------------------------------------
// Ids
//----------------------------------------------------------------------------------------------------------
std::string IdToKey(const JSONRPCId& id) {
    std::string key;
    std::visit([&key](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            key = "s:" + v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            key = "i:" + std::to_string(v);
        } else {
            key = "null";
        }
    }, id);
    return key;
}

std::string IdToString(const JSONRPCId& id) {
    std::string out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            out = "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out = std::to_string(v);
        } else {
            out = "null";
        }
    }, id);
    return out;
}

JSONValue IdToJSON(const JSONRPCId& id) {
    JSONValue out;
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out = JSONValue(nullptr);
        } else {
            out = JSONValue(v);
        }
    }, id);
    return out;
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& value) {
    if (std::holds_alternative<std::string>(value.value)) {
        return JSONRPCId{std::get<std::string>(value.value)};
    }
    if (std::holds_alternative<int64_t>(value.value)) {
        return JSONRPCId{std::get<int64_t>(value.value)};
    }
    if (std::holds_alternative<std::nullptr_t>(value.value)) {
        return JSONRPCId{nullptr};
    }
    return std::nullopt;
}

//----------------------------------------------------------------------------------------------------------
// Messages
//----------------------------------------------------------------------------------------------------------
MessageKind ClassifyMessage(const JSONValue& message) {
    if (!message.isObject()) {
        return MessageKind::Invalid;
    }
    const bool hasMethod = GetStringMember(message, "method").has_value();
    const JSONValue* id = FindMember(message, "id");
    if (hasMethod) {
        return id ? MessageKind::Request : MessageKind::Notification;
    }
    if (id && (FindMember(message, "result") || FindMember(message, "error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

const char* MessageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request: return "request";
        case MessageKind::Response: return "response";
        case MessageKind::Notification: return "notification";
        default: return "invalid";
    }
}

std::string JSONRPCMessage::Serialize() const {
    return SerializeJSON(ToJSON());
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", e.what());
        return false;
    }
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    if (ClassifyMessage(value) != MessageKind::Request) {
        return false;
    }
    auto parsedId = IdFromJSON(*FindMember(value, "id"));
    if (!parsedId.has_value()) {
        return false;
    }
    id = std::move(parsedId.value());
    method = GetStringMember(value, "method").value_or("");
    if (const JSONValue* p = FindMember(value, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.value_or(JSONValue(JSONValue::Object{})));
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    if (ClassifyMessage(value) != MessageKind::Response) {
        return false;
    }
    auto parsedId = IdFromJSON(*FindMember(value, "id"));
    if (!parsedId.has_value()) {
        return false;
    }
    id = std::move(parsedId.value());
    result.reset();
    error.reset();
    if (const JSONValue* r = FindMember(value, "result")) {
        result = *r;
    }
    if (const JSONValue* e = FindMember(value, "error")) {
        error = *e;
    }
    return true;
}

JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    if (ClassifyMessage(value) != MessageKind::Notification) {
        return false;
    }
    method = GetStringMember(value, "method").value_or("");
    if (const JSONValue* p = FindMember(value, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpio
