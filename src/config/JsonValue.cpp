/**
 * @file JsonValue.cpp
 * @brief Simple recursive-descent JSON parser
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/config/JsonValue.hpp"
#include <cctype>
#include <stdexcept>

namespace dedup {

namespace {  // Anonymous namespace for implementation details

class JsonParser {
public:
    explicit JsonParser(const std::string& json) : json_(json), pos_(0) {}

    JsonValue parse() {
        skipWhitespace();
        return parseValue();
    }

    bool atEnd() {
        skipWhitespace();
        return pos_ >= json_.size();
    }

private:
    const std::string& json_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
    }

    void skipWhitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const {
        return (pos_ < json_.size()) ? json_[pos_] : '\0';
    }

    char consume() {
        return (pos_ < json_.size()) ? json_[pos_++] : '\0';
    }

    void expect(char c) {
        skipWhitespace();
        if (consume() != c) {
            fail("expected '" + std::string(1, c) + "'");
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        fail("unexpected character");
    }

    static void appendUtf8(std::string& out, unsigned int cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    unsigned int parseHex4() {
        if (pos_ + 4 > json_.size()) {
            fail("truncated \\u escape");
        }
        unsigned int cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
            else fail("invalid \\u escape");
        }
        return cp;
    }

    JsonValue parseString() {
        expect('"');
        std::string result;

        while (pos_ < json_.size() && json_[pos_] != '"') {
            if (json_[pos_] == '\\') {
                ++pos_;
                if (pos_ >= json_.size()) break;
                char escaped = json_[pos_++];
                switch (escaped) {
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    case 'r': result += '\r'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'u': {
                        unsigned int cp = parseHex4();
                        // Surrogate pair
                        if (cp >= 0xD800 && cp <= 0xDBFF &&
                            json_.compare(pos_, 2, "\\u") == 0) {
                            pos_ += 2;
                            unsigned int low = parseHex4();
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        }
                        appendUtf8(result, cp);
                        break;
                    }
                    default: result += escaped; break;
                }
            } else {
                result += json_[pos_++];
            }
        }

        expect('"');
        return JsonValue(result);
    }

    JsonValue parseNumber() {
        size_t start = pos_;

        if (json_[pos_] == '-') ++pos_;

        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;

        if (pos_ < json_.size() && json_[pos_] == '.') {
            ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }

        if (pos_ < json_.size() && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < json_.size() && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }

        std::string numStr = json_.substr(start, pos_ - start);
        try {
            return JsonValue(std::stod(numStr));
        } catch (const std::logic_error&) {
            fail("invalid number '" + numStr + "'");
        }
    }

    JsonValue parseBool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return JsonValue(true);
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonValue(false);
        }
        fail("expected boolean");
    }

    JsonValue parseNull() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return JsonValue();
        }
        fail("expected null");
    }

    JsonValue parseArray() {
        expect('[');
        JsonValue::Array arr;

        skipWhitespace();
        if (peek() == ']') {
            consume();
            return JsonValue(arr);
        }

        while (true) {
            arr.push_back(parseValue());

            skipWhitespace();
            if (peek() == ']') {
                consume();
                break;
            }
            expect(',');
        }

        return JsonValue(arr);
    }

    JsonValue parseObject() {
        expect('{');
        JsonValue::Object obj;

        skipWhitespace();
        if (peek() == '}') {
            consume();
            return JsonValue(obj);
        }

        while (true) {
            skipWhitespace();
            auto keyValue = parseString();
            std::string key = keyValue.getString();

            skipWhitespace();
            expect(':');

            obj[key] = parseValue();

            skipWhitespace();
            if (peek() == '}') {
                consume();
                break;
            }
            expect(',');
        }

        return JsonValue(obj);
    }
};

}  // anonymous namespace

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue null;
    if (!isObject()) {
        return null;
    }
    auto it = getObject().find(key);
    return it != getObject().end() ? it->second : null;
}

const char* JsonValue::typeName() const {
    switch (storage_.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "number";
        case 3: return "string";
        case 4: return "array";
        default: return "object";
    }
}

JsonValue parseJson(const std::string& json) {
    JsonParser parser(json);
    JsonValue root = parser.parse();
    if (!parser.atEnd()) {
        throw std::runtime_error("JSON parse error: trailing content after document");
    }
    return root;
}

std::vector<JsonValue> parseJsonSequence(const std::string& json) {
    JsonParser parser(json);
    std::vector<JsonValue> documents;
    while (!parser.atEnd()) {
        documents.push_back(parser.parse());
    }
    return documents;
}

} // namespace dedup
