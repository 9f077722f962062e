//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser/serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <limits>
#include <iomanip>
#include <fmt/format.h>
#include "jsonrpc/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace jsonrpc {

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

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    // A null shared_ptr member is treated as JSON null
    static const JSONValue kNull;
    return it->second ? it->second.get() : &kNull;
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    const bool aNum = std::holds_alternative<int64_t>(a.value) || std::holds_alternative<double>(a.value);
    const bool bNum = std::holds_alternative<int64_t>(b.value) || std::holds_alternative<double>(b.value);
    if (aNum && bNum) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        auto asDouble = [](const JSONValue& v) {
            return std::holds_alternative<int64_t>(v.value) ? static_cast<double>(std::get<int64_t>(v.value))
                                                            : std::get<double>(v.value);
        };
        return asDouble(a) == asDouble(b);
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (std::holds_alternative<JSONValue::Array>(a.value)) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t i = 0; i < x.size(); ++i) {
            const JSONValue nullValue;
            const JSONValue& l = x[i] ? *x[i] : nullValue;
            const JSONValue& r = y[i] ? *y[i] : nullValue;
            if (l != r) return false;
        }
        return true;
    }
    if (std::holds_alternative<JSONValue::Object>(a.value)) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            const JSONValue* other = b.Find(key);
            if (other == nullptr) return false;
            const JSONValue nullValue;
            if ((val ? *val : nullValue) != *other) return false;
        }
        return true;
    }
    return a.value == b.value;
}

const char* ValueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Bool:    return "boolean";
        case ValueKind::Integer: return "integer";
        case ValueKind::Number:  return "number";
        case ValueKind::String:  return "string";
        case ValueKind::Array:   return "array";
        case ValueKind::Object:  return "object";
        case ValueKind::Any:     return "any";
        case ValueKind::Error:   return "error";
    }
    return "unknown";
}

ValueKind KindOf(const JSONValue& value) {
    return std::visit([](const auto& v) -> ValueKind {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return ValueKind::Null;
        else if constexpr (std::is_same_v<T, bool>) return ValueKind::Bool;
        else if constexpr (std::is_same_v<T, int64_t>) return ValueKind::Integer;
        else if constexpr (std::is_same_v<T, double>) return ValueKind::Number;
        else if constexpr (std::is_same_v<T, std::string>) return ValueKind::String;
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return ValueKind::Array;
        else return ValueKind::Object;
    }, value.value);
}

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return "null";
        }
    }, id);
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(fmt::format("JSON syntax error at offset {}: {}", i, what));
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

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
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

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
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
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate");
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
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("digit expected after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("digit expected in exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto res = std::from_chars(first, last, v);
            if (res.ec == std::errc() && res.ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: fall through to double
        }
        double d = 0.0;
        auto res = std::from_chars(first, last, d);
        if (res.ec != std::errc() || res.ptr != last) fail("number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' or ']' in array");
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
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("expected ',' or '}' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            out = parseNumber();
        } else {
            fail("unexpected character");
        }
        --depth;
        return out;
    }
};

void writeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
                return;
            }
            // Shortest round-trip form; keep a fraction so the value reads back as a double
            std::string num = fmt::format("{}", v);
            if (num.find_first_of(".eE") == std::string::npos) {
                num += ".0";
            }
            oss << num;
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) writeValue(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':';
                if (val) writeValue(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

JSONValue idToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) return JSONValue(v);
        else if constexpr (std::is_same_v<T, int64_t>) return JSONValue(v);
        else return JSONValue(nullptr);
    }, id);
}

bool readId(const JSONValue* v, JSONRPCId& out) {
    if (v == nullptr) return false;
    if (std::holds_alternative<int64_t>(v->value)) { out = std::get<int64_t>(v->value); return true; }
    if (std::holds_alternative<std::string>(v->value)) { out = std::get<std::string>(v->value); return true; }
    if (v->IsNull()) { out = nullptr; return true; }
    return false;
}

// The "jsonrpc" member is optional on input; when present it must be "2.0".
bool versionOk(const JSONValue& doc) {
    const JSONValue* ver = doc.Find("jsonrpc");
    if (ver == nullptr) return true;
    return std::holds_alternative<std::string>(ver->value) && std::get<std::string>(ver->value) == kProtocolVersion;
}

bool parseDocument(const std::string& json, JSONValue& doc, const char* what) {
    try {
        doc = ParseJSON(json);
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to parse {}: {}", what, e.what());
        return false;
    }
}
} // namespace

JSONValue ParseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) p.fail("trailing characters after JSON value");
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    oss << ",\"method\":";
    writeString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::FromJSON(const JSONValue& doc) {
    if (!doc.IsObject() || !versionOk(doc)) return false;
    const JSONValue* m = doc.Find("method");
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) return false;
    JSONRPCId parsedId;
    if (!readId(doc.Find("id"), parsedId)) return false;
    method = std::get<std::string>(m->value);
    id = std::move(parsedId);
    const JSONValue* p = doc.Find("params");
    params = p ? std::optional<JSONValue>(*p) : std::nullopt;
    return true;
}

JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(idToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    JSONValue doc;
    return parseDocument(json, doc, "JSONRPCRequest") && FromJSON(doc);
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"id\":";
    writeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    } else {
        // A response without error always carries result, null when unset
        oss << ",\"result\":";
        if (result.has_value()) writeValue(oss, result.value()); else oss << "null";
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::FromJSON(const JSONValue& doc) {
    if (!doc.IsObject() || !versionOk(doc)) return false;
    if (doc.Find("method") != nullptr) return false;
    JSONRPCId parsedId;
    if (!readId(doc.Find("id"), parsedId)) return false;
    const JSONValue* r = doc.Find("result");
    const JSONValue* e = doc.Find("error");
    if ((r == nullptr) == (e == nullptr)) return false;
    id = std::move(parsedId);
    result = r ? std::optional<JSONValue>(*r) : std::nullopt;
    error = e ? std::optional<JSONValue>(*e) : std::nullopt;
    return true;
}

JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(idToJSON(id));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.value_or(JSONValue(nullptr)));
    }
    return JSONValue(std::move(obj));
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    JSONValue doc;
    return parseDocument(json, doc, "JSONRPCResponse") && FromJSON(doc);
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"" << jsonrpc << "\"";
    oss << ",\"method\":";
    writeString(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::FromJSON(const JSONValue& doc) {
    if (!doc.IsObject() || !versionOk(doc)) return false;
    if (doc.Find("id") != nullptr) return false;
    const JSONValue* m = doc.Find("method");
    if (m == nullptr || !std::holds_alternative<std::string>(m->value)) return false;
    method = std::get<std::string>(m->value);
    const JSONValue* p = doc.Find("params");
    params = p ? std::optional<JSONValue>(*p) : std::nullopt;
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

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    JSONValue doc;
    return parseDocument(json, doc, "JSONRPCNotification") && FromJSON(doc);
}

// Batch wire shape
std::string SerializeBatch(const BatchResponses& batch) {
    FUNC_SCOPE();
    std::string out = "[";
    for (std::size_t k = 0; k < batch.size(); ++k) {
        if (k > 0) out += ",";
        out += batch[k].Serialize();
    }
    out += "]";
    return out;
}

bool DeserializeBatch(const std::string& json, BatchResponses& out) {
    FUNC_SCOPE();
    JSONValue doc;
    if (!parseDocument(json, doc, "BatchResponses") || !doc.IsArray()) return false;
    BatchResponses parsed;
    for (const auto& item : std::get<JSONValue::Array>(doc.value)) {
        JSONRPCResponse resp;
        if (!item || !resp.FromJSON(*item)) return false;
        parsed.push_back(std::move(resp));
    }
    out = std::move(parsed);
    return true;
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::optional<JSONRPCError> ParseErrorObject(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    const JSONValue* message = errVal.Find("message");
    if (code == nullptr || message == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !std::holds_alternative<std::string>(message->value)) {
        return std::nullopt;
    }
    const int64_t wireCode = std::get<int64_t>(code->value);
    if (wireCode < std::numeric_limits<int>::min() || wireCode > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    JSONRPCError e;
    e.code = static_cast<int>(wireCode);
    e.message = std::get<std::string>(message->value);
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    return e;
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace jsonrpc
