/**
 * @file beacon_json.hpp
 * @brief JSON values for event records and API payloads
 * @author Bennie Shearer
 * @version 1.0.0
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Records are written one per line, so dump() without an indent never emits
 * a raw newline. Parsing accepts RFC 8259 text including \u escapes and
 * surrogate pairs and rejects anything trailing the value.
 */

#ifndef MAILBEACON_JSON_HPP
#define MAILBEACON_JSON_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace mailbeacon {
namespace json {

class JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/**
 * @brief Thrown by parse() with the byte offset of the failure
 */
class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

/**
 * @class JsonValue
 * @brief null, bool, number, string, array or object
 */
class JsonValue {
public:
    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool b) : v_(b) {}
    JsonValue(int n) : v_(static_cast<double>(n)) {}
    JsonValue(long n) : v_(static_cast<double>(n)) {}
    JsonValue(long long n) : v_(static_cast<double>(n)) {}
    JsonValue(double d) : v_(d) {}
    JsonValue(const char* s) : v_(std::string(s)) {}
    JsonValue(std::string s) : v_(std::move(s)) {}
    JsonValue(std::string_view s) : v_(std::string(s)) {}
    /// Absent optional becomes null
    JsonValue(const std::optional<std::string>& s) {
        if (s) v_ = *s;
    }
    JsonValue(JsonArray a) : v_(std::move(a)) {}
    JsonValue(JsonObject o) : v_(std::move(o)) {}

    [[nodiscard]] bool isNull() const noexcept { return v_.index() == 0; }
    [[nodiscard]] bool isBool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool isNumber() const noexcept { return is<double>(); }
    [[nodiscard]] bool isString() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool isArray() const noexcept { return is<JsonArray>(); }
    [[nodiscard]] bool isObject() const noexcept { return is<JsonObject>(); }

    [[nodiscard]] bool asBool() const { return as<bool>("boolean"); }
    [[nodiscard]] double asNumber() const { return as<double>("number"); }
    [[nodiscard]] const std::string& asString() const { return as<std::string>("string"); }
    [[nodiscard]] const JsonArray& asArray() const { return as<JsonArray>("array"); }
    [[nodiscard]] const JsonObject& asObject() const { return as<JsonObject>("object"); }
    [[nodiscard]] JsonArray& asArray() { return as<JsonArray>("array"); }
    [[nodiscard]] JsonObject& asObject() { return as<JsonObject>("object"); }

    /// This value if it is a string
    [[nodiscard]] std::optional<std::string> getString() const {
        if (auto* s = std::get_if<std::string>(&v_)) return *s;
        return std::nullopt;
    }

    /// Object member, nullptr when absent or when this is not an object
    [[nodiscard]] const JsonValue* find(const std::string& key) const noexcept {
        auto* obj = std::get_if<JsonObject>(&v_);
        if (!obj) return nullptr;
        auto it = obj->find(key);
        return it == obj->end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const std::string& key) const noexcept { return find(key) != nullptr; }

    /**
     * @brief String member of an object, nullopt when absent, null or not a string
     */
    [[nodiscard]] std::optional<std::string> getString(const std::string& key) const {
        const JsonValue* member = find(key);
        return member ? member->getString() : std::nullopt;
    }

    /// Element count of an array or object, 0 otherwise
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* a = std::get_if<JsonArray>(&v_)) return a->size();
        if (auto* o = std::get_if<JsonObject>(&v_)) return o->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] const JsonValue& operator[](std::size_t i) const { return asArray().at(i); }
    [[nodiscard]] JsonValue& operator[](std::size_t i) { return asArray().at(i); }

    /// Const lookup throws std::out_of_range for a missing key
    [[nodiscard]] const JsonValue& operator[](const std::string& key) const { return asObject().at(key); }
    /// Inserts null for a missing key
    [[nodiscard]] JsonValue& operator[](const std::string& key) { return asObject()[key]; }

    void push_back(JsonValue v) { asArray().push_back(std::move(v)); }

    /**
     * @brief Serialize
     * @param indent Spaces per level; negative gives compact single-line output
     */
    [[nodiscard]] std::string dump(int indent = -1) const {
        std::string out;
        write(out, indent, 0);
        return out;
    }

    [[nodiscard]] bool operator==(const JsonValue& other) const { return v_ == other.v_; }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(v_ == other.v_); }

private:
    using Storage = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

    template<typename T>
    bool is() const noexcept { return std::holds_alternative<T>(v_); }

    template<typename T>
    const T& as(const char* name) const {
        if (auto* p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("JSON value is not a ") + name);
    }

    template<typename T>
    T& as(const char* name) {
        if (auto* p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("JSON value is not a ") + name);
    }

    static void writeString(std::string& out, std::string_view s);
    static void writeNumber(std::string& out, double d);
    void write(std::string& out, int indent, int level) const;

    Storage v_{nullptr};
};

inline void JsonValue::writeString(std::string& out, std::string_view s) {
    static const char* hex = "0123456789abcdef";
    out += '"';
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (u < 0x20 || u == 0x7f) {
                    out += "\\u00";
                    out += hex[u >> 4];
                    out += hex[u & 0x0f];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

inline void JsonValue::writeNumber(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    if (d == std::trunc(d) && std::fabs(d) < 1e15) {
        out += std::to_string(static_cast<long long>(d));
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    out += buf;
}

inline void JsonValue::write(std::string& out, int indent, int level) const {
    const bool pretty = indent >= 0;
    auto newline = [&](int depth) {
        if (!pretty) return;
        out += '\n';
        out.append(static_cast<std::size_t>(depth * indent), ' ');
    };

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            writeNumber(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(out, v);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
            out += '[';
            bool first = true;
            for (const auto& item : v) {
                if (!first) out += ',';
                first = false;
                newline(level + 1);
                item.write(out, indent, level + 1);
            }
            if (!v.empty()) newline(level);
            out += ']';
        } else {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) out += ',';
                first = false;
                newline(level + 1);
                writeString(out, key);
                out += pretty ? ": " : ":";
                item.write(out, indent, level + 1);
            }
            if (!v.empty()) newline(level);
            out += '}';
        }
    }, v_);
}

namespace detail {

/**
 * @brief Recursive-descent reader over one JSON text
 */
class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    JsonValue document() {
        JsonValue v = value();
        skipSpace();
        if (pos_ != text_.size()) fail("Trailing characters after value");
        return v;
    }

private:
    static constexpr int kMaxDepth = 64;

    [[noreturn]] void fail(const std::string& what) const { throw JsonParseError(what, pos_); }

    void skipSpace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool atEnd() const { return pos_ >= text_.size(); }
    char cur() const { return atEnd() ? '\0' : text_[pos_]; }

    void require(char c) {
        if (cur() != c) fail(std::string("Expected '") + c + "'");
        ++pos_;
    }

    void literal(std::string_view word) {
        if (text_.substr(pos_, word.size()) != word) fail("Invalid literal");
        pos_ += word.size();
    }

    JsonValue value() {
        skipSpace();
        if (atEnd()) fail("Unexpected end of input");
        switch (cur()) {
            case '{': return object();
            case '[': return array();
            case '"': return JsonValue(string());
            case 't': literal("true"); return JsonValue(true);
            case 'f': literal("false"); return JsonValue(false);
            case 'n': literal("null"); return JsonValue(nullptr);
            default: break;
        }
        if (cur() == '-' || (cur() >= '0' && cur() <= '9')) return number();
        fail(std::string("Unexpected character '") + cur() + "'");
    }

    void digits() {
        if (!(cur() >= '0' && cur() <= '9')) fail("Invalid number");
        while (cur() >= '0' && cur() <= '9') ++pos_;
    }

    JsonValue number() {
        std::size_t start = pos_;
        if (cur() == '-') ++pos_;
        if (cur() == '0') {
            ++pos_;
        } else {
            digits();
        }
        if (cur() == '.') {
            ++pos_;
            digits();
        }
        if (cur() == 'e' || cur() == 'E') {
            ++pos_;
            if (cur() == '+' || cur() == '-') ++pos_;
            digits();
        }
        std::string token(text_.substr(start, pos_ - start));
        return JsonValue(std::strtod(token.c_str(), nullptr));
    }

    uint32_t hex4() {
        if (pos_ + 4 > text_.size()) fail("Truncated \\u escape");
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
            else fail("Invalid \\u escape");
        }
        return cp;
    }

    static void utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
            return;
        }
        if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        }
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }

    void escape(std::string& out) {
        if (atEnd()) fail("Unterminated escape");
        char c = text_[pos_++];
        switch (c) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                uint32_t cp = hex4();
                if (cp >= 0xDC00 && cp <= 0xDFFF) fail("Unpaired low surrogate");
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (text_.substr(pos_, 2) != "\\u") fail("Unpaired high surrogate");
                    pos_ += 2;
                    uint32_t low = hex4();
                    if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                utf8(out, cp);
                break;
            }
            default:
                fail(std::string("Invalid escape \\") + c);
        }
    }

    std::string string() {
        require('"');
        std::string out;
        for (;;) {
            if (atEnd()) fail("Unterminated string");
            char c = text_[pos_];
            if (c == '"') {
                ++pos_;
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            ++pos_;
            if (c == '\\') {
                escape(out);
            } else {
                out += c;
            }
        }
    }

    void enter() {
        if (++depth_ > kMaxDepth) fail("Nesting too deep");
    }

    JsonValue array() {
        require('[');
        enter();
        JsonArray items;
        skipSpace();
        if (cur() == ']') {
            ++pos_;
        } else {
            for (;;) {
                items.push_back(value());
                skipSpace();
                if (cur() == ',') { ++pos_; continue; }
                require(']');
                break;
            }
        }
        --depth_;
        return JsonValue(std::move(items));
    }

    JsonValue object() {
        require('{');
        enter();
        JsonObject members;
        skipSpace();
        if (cur() == '}') {
            ++pos_;
        } else {
            for (;;) {
                skipSpace();
                std::string key = string();
                skipSpace();
                require(':');
                members[std::move(key)] = value();
                skipSpace();
                if (cur() == ',') { ++pos_; continue; }
                require('}');
                break;
            }
        }
        --depth_;
        return JsonValue(std::move(members));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

} // namespace detail

/**
 * @brief Parse one JSON document
 * @throws JsonParseError on invalid input
 */
[[nodiscard]] inline JsonValue parse(std::string_view text) {
    return detail::Reader(text).document();
}

/// Parse, or nullopt on invalid input
[[nodiscard]] inline std::optional<JsonValue> tryParse(std::string_view text) {
    try {
        return detail::Reader(text).document();
    } catch (const JsonParseError&) {
        return std::nullopt;
    }
}

/**
 * @brief Fluent object builder: object().add("k", v).addNull("n").build()
 */
class ObjectBuilder {
public:
    template<typename T>
    ObjectBuilder& add(const std::string& key, T&& value) {
        members_[key] = JsonValue(std::forward<T>(value));
        return *this;
    }

    ObjectBuilder& addNull(const std::string& key) {
        members_[key] = JsonValue();
        return *this;
    }

    [[nodiscard]] JsonValue build() { return JsonValue(std::move(members_)); }

private:
    JsonObject members_;
};

[[nodiscard]] inline ObjectBuilder object() { return ObjectBuilder(); }

} // namespace json
} // namespace mailbeacon

#endif // MAILBEACON_JSON_HPP
