/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed JSON to an ostream. indent_size > 0 pretty-prints;
 * indent_size == 0 writes a single line (used for JSON-Lines progress).
 * Non-finite doubles are written as null.
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("runs", 10000);
 *     w.key("rates").begin_array();
 *       w.value(0.2); w.value(0.18);
 *     w.end_array();
 *   w.end_object();
 */

#ifndef GACHA_JSON_WRITER_HPP
#define GACHA_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace gacha {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{', OBJECT); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('[', ARRAY); }
    JsonWriter& end_array()    { return close(']'); }

    // ── Keys (object members) ──

    JsonWriter& key(const std::string& k) {
        write_separator();
        os_ << '"';
        write_escaped(k);
        os_ << (indent_size_ > 0 ? "\": " : "\":");
        expect_value_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        begin_value();
        os_ << '"';
        write_escaped(v);
        os_ << '"';
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v)        { begin_value(); os_ << v; return *this; }
    JsonWriter& value(long long v)  { begin_value(); os_ << v; return *this; }
    JsonWriter& value(size_t v)     { begin_value(); os_ << v; return *this; }

    JsonWriter& value(double v) {
        begin_value();
        if (std::isfinite(v)) {
            auto old = os_.precision(15);
            os_ << v;
            os_.precision(old);
        } else {
            os_ << "null";
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        begin_value();
        os_ << (v ? "true" : "false");
        return *this;
    }

    JsonWriter& null_value() {
        begin_value();
        os_ << "null";
        return *this;
    }

    /** Array of scalars. */
    template<typename T>
    JsonWriter& value(const std::vector<T>& values) {
        begin_array();
        for (const auto& v : values) value(v);
        return end_array();
    }

    // ── Convenience: key-value pair ──

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        value(v);
        return *this;
    }

private:
    enum ScopeType { OBJECT, ARRAY };

    struct Scope {
        ScopeType type;
        int count = 0;
    };

    std::ostream& os_;
    int indent_size_;
    std::vector<Scope> stack_;
    bool expect_value_ = false;

    JsonWriter& open(char c, ScopeType type) {
        begin_value();
        os_ << c;
        stack_.push_back({type, 0});
        return *this;
    }

    JsonWriter& close(char c) {
        bool had_items = !stack_.empty() && stack_.back().count > 0;
        if (!stack_.empty()) stack_.pop_back();
        if (had_items) newline();
        os_ << c;
        return *this;
    }

    void begin_value() {
        if (!expect_value_) write_separator();
        expect_value_ = false;
    }

    void write_separator() {
        if (expect_value_) return;  // value directly after its key
        if (stack_.empty()) return;

        auto& scope = stack_.back();
        if (scope.count > 0) os_ << ',';
        newline();
        scope.count++;
    }

    void newline() {
        if (indent_size_ <= 0) return;
        os_ << '\n';
        int depth = static_cast<int>(stack_.size());
        for (int i = 0; i < depth * indent_size_; i++) {
            os_ << ' ';
        }
    }

    void write_escaped(const std::string& s) {
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
    }
};

}  // namespace gacha

#endif  // GACHA_JSON_WRITER_HPP
