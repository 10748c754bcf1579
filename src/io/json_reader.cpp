/**
 * JSON Reader Implementation — Recursive descent parser
 */

#include "json_reader.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace gacha {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

const char* JsonValue::type_name() const {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "unknown";
}

bool JsonValue::as_bool() const {
    if (!is_bool()) throw std::runtime_error(std::string("JsonValue: expected bool, got ") + type_name());
    return bool_val_;
}

double JsonValue::as_number() const {
    if (!is_number()) throw std::runtime_error(std::string("JsonValue: expected number, got ") + type_name());
    return num_val_;
}

int JsonValue::as_int() const {
    double v = as_number();
    if (std::floor(v) != v ||
        v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        std::ostringstream ss;
        ss << "JsonValue: expected integer, got " << v;
        throw std::runtime_error(ss.str());
    }
    return static_cast<int>(v);
}

const std::string& JsonValue::as_string() const {
    if (!is_string()) throw std::runtime_error(std::string("JsonValue: expected string, got ") + type_name());
    return str_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    for (const auto& m : members_) {
        if (m.first == key) return m.second;
    }
    return null_value();
}

bool JsonValue::has(const std::string& key) const {
    for (const auto& m : members_) {
        if (m.first == key) return true;
    }
    return false;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (!is_array() || index >= elements_.size()) return null_value();
    return elements_[index];
}

size_t JsonValue::size() const {
    if (is_array()) return elements_.size();
    if (is_object()) return members_.size();
    return 0;
}

void JsonValue::add_member(std::string key, JsonValue&& val) {
    members_.emplace_back(std::move(key), std::move(val));
}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_whitespace();
        JsonValue val = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) throw error("Trailing characters after document");
        return val;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;

    char peek() const {
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    char advance() {
        if (pos_ >= src_.size()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    bool is_digit(char c) const {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    std::runtime_error error(const std::string& msg) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); i++) {
            if (src_[i] == '\n') { line++; col = 1; }
            else col++;
        }
        return std::runtime_error("JSON parse error at line " + std::to_string(line) +
                                  ", column " + std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '"') return JsonValue(parse_string());
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == 't' || c == 'f' || c == 'n') return parse_literal();
        if (c == '-' || is_digit(c)) return parse_number();
        if (c == '\0') throw error("Unexpected end of input");

        throw error(std::string("Unexpected character: '") + c + "'");
    }

    void append_utf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= src_.size()) throw error("Unterminated string");
            char c = src_[pos_++];

            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }

            char esc = advance();
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    // BMP only; surrogate pairs are not combined.
                    if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
                    std::string hex = src_.substr(pos_, 4);
                    for (char h : hex) {
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw error("Invalid \\u escape");
                        }
                    }
                    pos_ += 4;
                    append_utf8(result, std::strtoul(hex.c_str(), nullptr, 16));
                    break;
                }
                default:
                    throw error(std::string("Unknown escape: \\") + esc);
            }
        }
        return result;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) pos_++;
        } else {
            throw error("Expected digit in number");
        }

        if (peek() == '.') {
            pos_++;
            if (!is_digit(peek())) throw error("Expected digit after decimal point");
            while (is_digit(peek())) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!is_digit(peek())) throw error("Expected digit in exponent");
            while (is_digit(peek())) pos_++;
        }

        std::string numstr = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(numstr.c_str(), nullptr));
    }

    JsonValue parse_literal() {
        if (src_.compare(pos_, 4, "true") == 0)  { pos_ += 4; return JsonValue(true); }
        if (src_.compare(pos_, 5, "false") == 0) { pos_ += 5; return JsonValue(false); }
        if (src_.compare(pos_, 4, "null") == 0)  { pos_ += 4; return JsonValue(); }
        throw error("Expected 'true', 'false' or 'null'");
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj;
        obj.set_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') throw error("Expected string key");
            const size_t key_pos = pos_;
            std::string key = parse_string();
            if (obj.has(key)) {
                pos_ = key_pos;
                throw error("Duplicate key '" + key + "'");
            }
            skip_whitespace();
            expect(':');
            obj.add_member(std::move(key), parse_value());

            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr;
        arr.set_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

}  // namespace gacha
