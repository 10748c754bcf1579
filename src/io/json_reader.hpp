/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes. Object
 * members keep their document order and duplicate keys are a parse error.
 * Errors carry the line and column of the offending character.
 * No external dependencies.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("machine.json");
 *   int per_item = root["capsules_per_item"].as_int();
 *   for (const auto& [name, w] : root["item_desire"].members()) { ... }
 */

#ifndef GACHA_JSON_READER_HPP
#define GACHA_JSON_READER_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gacha {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    using Member = std::pair<std::string, JsonValue>;

    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Accessors throw on type mismatch
    bool as_bool() const;
    double as_number() const;
    /** Number with no fractional part that fits in an int. */
    int as_int() const;
    const std::string& as_string() const;

    // Object access. Missing keys yield a shared null value.
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;
    const std::vector<Member>& members() const { return members_; }

    // Array access. Out-of-range yields a shared null value.
    const JsonValue& operator[](size_t index) const;
    const std::vector<JsonValue>& elements() const { return elements_; }

    size_t size() const;

    /** Name of the type, for error messages. */
    const char* type_name() const;

    // Builders (used by the parser)
    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }
    /** Appends; the parser rejects duplicate keys before calling this. */
    void add_member(std::string key, JsonValue&& val);
    void add_element(JsonValue&& val) { elements_.push_back(std::move(val)); }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::vector<Member> members_;
    std::vector<JsonValue> elements_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a JSON document. Trailing non-whitespace is an error.
     * @throws std::runtime_error "JSON parse error at line L, column C: ..."
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error on file or parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace gacha

#endif  // GACHA_JSON_READER_HPP
