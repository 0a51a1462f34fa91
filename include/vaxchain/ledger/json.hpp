#pragma once

#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "vaxchain/common/error.hpp"

namespace vaxchain::ledger {

    // JSON serialization utilities
    class JsonSerializer {
      public:
        static std::string escapeJson(const std::string &str) {
            std::string result;
            result.reserve(str.size());
            for (char c : str) {
                switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        result += buf;
                    } else {
                        result += c;
                    }
                    break;
                }
            }
            return result;
        }

        static std::string quote(const std::string &str) { return "\"" + escapeJson(str) + "\""; }
    };

    /// Parsed JSON value. Objects keep their member order.
    class JsonValue {
      public:
        enum class Kind { Null, Bool, Number, String, Array, Object };

        JsonValue() = default;

        static JsonValue makeString(std::string s) {
            JsonValue v;
            v.kind_ = Kind::String;
            v.text_ = std::move(s);
            return v;
        }

        static JsonValue makeNumber(std::string literal) {
            JsonValue v;
            v.kind_ = Kind::Number;
            v.text_ = std::move(literal);
            return v;
        }

        static JsonValue makeBool(bool b) {
            JsonValue v;
            v.kind_ = Kind::Bool;
            v.bool_ = b;
            return v;
        }

        /// Parse a complete JSON text; trailing garbage is rejected
        static dp::Result<JsonValue, dp::Error> parse(const std::string &text);

        inline Kind kind() const { return kind_; }
        inline bool isNull() const { return kind_ == Kind::Null; }
        inline bool isBool() const { return kind_ == Kind::Bool; }
        inline bool isNumber() const { return kind_ == Kind::Number; }
        inline bool isString() const { return kind_ == Kind::String; }
        inline bool isArray() const { return kind_ == Kind::Array; }
        inline bool isObject() const { return kind_ == Kind::Object; }

        inline bool asBool() const { return bool_; }
        inline const std::string &asString() const { return text_; }

        /// Integral value of a number. Fails for fractions and out-of-range literals.
        inline dp::Result<int64_t, dp::Error> asInt() const {
            if (kind_ != Kind::Number) {
                return dp::Result<int64_t, dp::Error>::err(decode_error("Value is not a number"));
            }
            if (text_.find_first_of(".eE") != std::string::npos) {
                return dp::Result<int64_t, dp::Error>::err(decode_error("Value is not an integer"));
            }
            try {
                size_t used = 0;
                long long v = std::stoll(text_, &used);
                if (used != text_.size()) {
                    return dp::Result<int64_t, dp::Error>::err(decode_error("Value is not an integer"));
                }
                return dp::Result<int64_t, dp::Error>::ok(static_cast<int64_t>(v));
            } catch (const std::exception &) {
                return dp::Result<int64_t, dp::Error>::err(decode_error("Integer out of range"));
            }
        }

        inline const std::vector<JsonValue> &items() const { return items_; }
        inline const std::vector<std::pair<std::string, JsonValue>> &members() const { return members_; }

        /// Object member lookup, nullptr when absent or when this is not an object
        inline const JsonValue *find(const std::string &key) const {
            if (kind_ != Kind::Object)
                return nullptr;
            for (const auto &[k, v] : members_) {
                if (k == key)
                    return &v;
            }
            return nullptr;
        }

        /// Compact re-encoding
        std::string dump() const;

      private:
        friend class JsonParser;

        Kind kind_ = Kind::Null;
        bool bool_ = false;
        std::string text_;
        std::vector<JsonValue> items_;
        std::vector<std::pair<std::string, JsonValue>> members_;
    };

    /// Recursive-descent parser behind JsonValue::parse
    class JsonParser {
      public:
        explicit JsonParser(const std::string &text) : text_(text) {}

        inline dp::Result<JsonValue, dp::Error> run() {
            JsonValue value;
            if (!parseValue(value, 0)) {
                return dp::Result<JsonValue, dp::Error>::err(decode_error(errorText(error_)));
            }
            skipWhitespace();
            if (pos_ != text_.size()) {
                return dp::Result<JsonValue, dp::Error>::err(
                    decode_error(errorText("Unexpected trailing data at offset " + std::to_string(pos_))));
            }
            return dp::Result<JsonValue, dp::Error>::ok(std::move(value));
        }

      private:
        static constexpr int MAX_DEPTH = 64;

        const std::string &text_;
        size_t pos_ = 0;
        std::string error_;

        inline bool fail(const std::string &what) {
            error_ = what + " at offset " + std::to_string(pos_);
            return false;
        }

        inline void skipWhitespace() {
            while (pos_ < text_.size() &&
                   (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' || text_[pos_] == '\t'))
                pos_++;
        }

        inline bool consumeLiteral(const char *lit) {
            std::string s(lit);
            if (text_.compare(pos_, s.size(), s) != 0)
                return false;
            pos_ += s.size();
            return true;
        }

        inline bool parseValue(JsonValue &out, int depth) {
            if (depth > MAX_DEPTH)
                return fail("Nesting too deep");
            skipWhitespace();
            if (pos_ >= text_.size())
                return fail("Unexpected end of input");

            char c = text_[pos_];
            if (c == '{')
                return parseObject(out, depth);
            if (c == '[')
                return parseArray(out, depth);
            if (c == '"') {
                std::string s;
                if (!parseString(s))
                    return false;
                out = JsonValue::makeString(std::move(s));
                return true;
            }
            if (c == 't') {
                if (!consumeLiteral("true"))
                    return fail("Invalid literal");
                out = JsonValue::makeBool(true);
                return true;
            }
            if (c == 'f') {
                if (!consumeLiteral("false"))
                    return fail("Invalid literal");
                out = JsonValue::makeBool(false);
                return true;
            }
            if (c == 'n') {
                if (!consumeLiteral("null"))
                    return fail("Invalid literal");
                out = JsonValue();
                return true;
            }
            if (c == '-' || (c >= '0' && c <= '9'))
                return parseNumber(out);
            return fail("Unexpected character");
        }

        inline bool parseNumber(JsonValue &out) {
            size_t start = pos_;
            if (text_[pos_] == '-')
                pos_++;
            size_t digits = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9')
                pos_++;
            if (pos_ == digits)
                return fail("Invalid number");
            if (pos_ < text_.size() && text_[pos_] == '.') {
                pos_++;
                size_t frac = pos_;
                while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9')
                    pos_++;
                if (pos_ == frac)
                    return fail("Invalid number");
            }
            if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
                pos_++;
                if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-'))
                    pos_++;
                size_t exp = pos_;
                while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9')
                    pos_++;
                if (pos_ == exp)
                    return fail("Invalid number");
            }
            out = JsonValue::makeNumber(text_.substr(start, pos_ - start));
            return true;
        }

        static inline void appendUtf8(std::string &s, uint32_t cp) {
            if (cp < 0x80) {
                s += static_cast<char>(cp);
            } else if (cp < 0x800) {
                s += static_cast<char>(0xC0 | (cp >> 6));
                s += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                s += static_cast<char>(0xE0 | (cp >> 12));
                s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                s += static_cast<char>(0x80 | (cp & 0x3F));
            } else {
                s += static_cast<char>(0xF0 | (cp >> 18));
                s += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                s += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                s += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        inline bool parseHex4(uint32_t &cp) {
            if (pos_ + 4 > text_.size())
                return fail("Truncated unicode escape");
            cp = 0;
            for (int i = 0; i < 4; ++i) {
                char h = text_[pos_++];
                cp <<= 4;
                if (h >= '0' && h <= '9')
                    cp |= static_cast<uint32_t>(h - '0');
                else if (h >= 'a' && h <= 'f')
                    cp |= static_cast<uint32_t>(h - 'a' + 10);
                else if (h >= 'A' && h <= 'F')
                    cp |= static_cast<uint32_t>(h - 'A' + 10);
                else
                    return fail("Invalid unicode escape");
            }
            return true;
        }

        inline bool parseString(std::string &out) {
            pos_++; // opening quote
            while (pos_ < text_.size()) {
                char c = text_[pos_++];
                if (c == '"')
                    return true;
                if (static_cast<unsigned char>(c) < 0x20)
                    return fail("Control character in string");
                if (c != '\\') {
                    out += c;
                    continue;
                }
                if (pos_ >= text_.size())
                    break;
                char e = text_[pos_++];
                switch (e) {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parseHex4(cp))
                        return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        uint32_t low = 0;
                        if (!(consumeLiteral("\\u") && parseHex4(low)) || low < 0xDC00 || low > 0xDFFF)
                            return fail("Invalid surrogate pair");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, cp);
                    break;
                }
                default:
                    return fail("Invalid escape");
                }
            }
            return fail("Unterminated string");
        }

        inline bool parseArray(JsonValue &out, int depth) {
            pos_++;
            out = JsonValue();
            out.kind_ = JsonValue::Kind::Array;
            skipWhitespace();
            if (pos_ < text_.size() && text_[pos_] == ']') {
                pos_++;
                return true;
            }
            while (true) {
                JsonValue item;
                if (!parseValue(item, depth + 1))
                    return false;
                out.items_.push_back(std::move(item));
                skipWhitespace();
                if (pos_ >= text_.size())
                    return fail("Unterminated array");
                if (text_[pos_] == ',') {
                    pos_++;
                    continue;
                }
                if (text_[pos_] == ']') {
                    pos_++;
                    return true;
                }
                return fail("Expected ',' or ']'");
            }
        }

        inline bool parseObject(JsonValue &out, int depth) {
            pos_++;
            out = JsonValue();
            out.kind_ = JsonValue::Kind::Object;
            skipWhitespace();
            if (pos_ < text_.size() && text_[pos_] == '}') {
                pos_++;
                return true;
            }
            while (true) {
                skipWhitespace();
                if (pos_ >= text_.size() || text_[pos_] != '"')
                    return fail("Expected member name");
                std::string key;
                if (!parseString(key))
                    return false;
                skipWhitespace();
                if (pos_ >= text_.size() || text_[pos_] != ':')
                    return fail("Expected ':'");
                pos_++;
                JsonValue value;
                if (!parseValue(value, depth + 1))
                    return false;
                out.members_.emplace_back(std::move(key), std::move(value));
                skipWhitespace();
                if (pos_ >= text_.size())
                    return fail("Unterminated object");
                if (text_[pos_] == ',') {
                    pos_++;
                    continue;
                }
                if (text_[pos_] == '}') {
                    pos_++;
                    return true;
                }
                return fail("Expected ',' or '}'");
            }
        }
    };

    inline dp::Result<JsonValue, dp::Error> JsonValue::parse(const std::string &text) {
        JsonParser parser(text);
        return parser.run();
    }

    inline std::string JsonValue::dump() const {
        switch (kind_) {
        case Kind::Null:
            return "null";
        case Kind::Bool:
            return bool_ ? "true" : "false";
        case Kind::Number:
            return text_;
        case Kind::String:
            return JsonSerializer::quote(text_);
        case Kind::Array: {
            std::string out = "[";
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0)
                    out += ",";
                out += items_[i].dump();
            }
            return out + "]";
        }
        case Kind::Object: {
            std::string out = "{";
            bool first = true;
            for (const auto &[k, v] : members_) {
                if (!first)
                    out += ",";
                out += JsonSerializer::quote(k) + ":" + v.dump();
                first = false;
            }
            return out + "}";
        }
        }
        return "null";
    }

    /// Streaming writer for flat JSON objects, fields are emitted in call order
    class JsonWriter {
      public:
        JsonWriter() { ss_ << '{'; }

        inline JsonWriter &field(const std::string &key, const std::string &value) {
            separator(key);
            ss_ << JsonSerializer::quote(value);
            return *this;
        }

        inline JsonWriter &field(const std::string &key, const char *value) { return field(key, std::string(value)); }

        inline JsonWriter &field(const std::string &key, int64_t value) {
            separator(key);
            ss_ << value;
            return *this;
        }

        inline JsonWriter &field(const std::string &key, bool value) {
            separator(key);
            ss_ << (value ? "true" : "false");
            return *this;
        }

        /// Optional string field, skipped when empty
        inline JsonWriter &fieldIfSet(const std::string &key, const std::string &value) {
            if (!value.empty())
                field(key, value);
            return *this;
        }

        /// Pre-encoded JSON value
        inline JsonWriter &raw(const std::string &key, const std::string &json) {
            separator(key);
            ss_ << json;
            return *this;
        }

        inline std::string str() const { return ss_.str() + "}"; }

      private:
        std::ostringstream ss_;
        bool first_ = true;

        inline void separator(const std::string &key) {
            if (!first_)
                ss_ << ',';
            first_ = false;
            ss_ << JsonSerializer::quote(key) << ':';
        }
    };

    /// Join already-encoded JSON documents into an array without re-encoding them
    inline std::string joinJsonArray(const std::vector<std::string> &documents) {
        std::string out = "[";
        for (size_t i = 0; i < documents.size(); ++i) {
            if (i > 0)
                out += ",";
            out += documents[i];
        }
        return out + "]";
    }

} // namespace vaxchain::ledger
