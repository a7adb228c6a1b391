#include "arbscan/json_fields.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace arbscan::json {

namespace {

class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text), pos_(0) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool at_end() const { return pos_ >= text_.size(); }

    char peek() const {
        if (at_end()) {
            throw ParseError("unexpected end of input");
        }
        return text_[pos_];
    }

    void expect(char c) {
        skip_ws();
        if (peek() != c) {
            throw ParseError(std::string("expected '") + c + "' at offset " + std::to_string(pos_));
        }
        ++pos_;
    }

    bool consume(char c) {
        skip_ws();
        if (!at_end() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            char c = peek();
            ++pos_;
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char esc = peek();
            ++pos_;
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u':  append_utf8(out, parse_hex4()); break;
                default:
                    throw ParseError(std::string("bad escape \\") + esc);
            }
        }
    }

    // Returns the value with its kind; containers are kept as raw text
    Value parse_value() {
        skip_ws();
        Value v;
        const char c = peek();
        if (c == '"') {
            v.kind = Kind::String;
            v.text = parse_string();
        } else if (c == '{' || c == '[') {
            v.kind = (c == '{') ? Kind::Object : Kind::Array;
            v.text = scan_container();
        } else if (c == 't' || c == 'f') {
            v.kind = Kind::Bool;
            v.text = scan_literal(c == 't' ? "true" : "false");
        } else if (c == 'n') {
            v.kind = Kind::Null;
            v.text = scan_literal("null");
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            v.kind = Kind::Number;
            const std::size_t start = pos_;
            while (!at_end()) {
                const char d = text_[pos_];
                if ((d >= '0' && d <= '9') || d == '-' || d == '+' || d == '.' || d == 'e' || d == 'E') {
                    ++pos_;
                } else {
                    break;
                }
            }
            v.text = text_.substr(start, pos_ - start);
        } else {
            throw ParseError(std::string("unexpected character '") + c + "' at offset " + std::to_string(pos_));
        }
        return v;
    }

private:
    unsigned parse_hex4() {
        if (pos_ + 4 > text_.size()) {
            throw ParseError("truncated \\u escape");
        }
        unsigned cp = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else throw ParseError("bad \\u escape");
        }
        return cp;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string scan_literal(const char* word) {
        const std::string w(word);
        if (text_.compare(pos_, w.size(), w) != 0) {
            throw ParseError("bad literal at offset " + std::to_string(pos_));
        }
        pos_ += w.size();
        return w;
    }

    std::string scan_container() {
        const std::size_t start = pos_;
        int depth = 0;
        bool in_string = false;
        while (!at_end()) {
            const char c = text_[pos_++];
            if (in_string) {
                if (c == '\\') {
                    ++pos_;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            if (c == '"') {
                in_string = true;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return text_.substr(start, pos_ - start);
                }
            }
        }
        throw ParseError("unterminated object or array");
    }

    const std::string& text_;
    std::size_t pos_;
};

} // namespace

bool FlatObject::has(const std::string& key) const {
    return fields_.count(key) != 0;
}

const Value* FlatObject::find(const std::string& key) const {
    auto it = fields_.find(key);
    return it == fields_.end() ? nullptr : &it->second;
}

std::string FlatObject::get_string(const std::string& key) const {
    const Value* v = find(key);
    if (!v || v->kind != Kind::String) {
        throw ParseError("missing string field '" + key + "'");
    }
    return v->text;
}

double FlatObject::get_double(const std::string& key) const {
    const Value* v = find(key);
    if (!v) {
        throw ParseError("missing numeric field '" + key + "'");
    }
    return to_double(*v);
}

std::int64_t FlatObject::get_int64(const std::string& key) const {
    const Value* v = find(key);
    if (!v || v->kind != Kind::Number) {
        throw ParseError("missing integer field '" + key + "'");
    }
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(v->text.c_str(), &end, 10);
    if (errno != 0 || end == v->text.c_str() || *end != '\0') {
        throw ParseError("field '" + key + "' is not an integer: " + v->text);
    }
    return static_cast<std::int64_t>(n);
}

std::uint64_t FlatObject::get_uint64(const std::string& key) const {
    const std::int64_t n = get_int64(key);
    if (n < 0) {
        throw ParseError("field '" + key + "' is negative");
    }
    return static_cast<std::uint64_t>(n);
}

std::string FlatObject::get_raw(const std::string& key) const {
    const Value* v = find(key);
    if (!v) {
        throw ParseError("missing field '" + key + "'");
    }
    return v->text;
}

std::optional<std::string> FlatObject::find_string(const std::string& key) const {
    const Value* v = find(key);
    if (!v || v->kind != Kind::String) {
        return std::nullopt;
    }
    return v->text;
}

FlatObject parse_object(const std::string& text) {
    Cursor cur(text);
    FlatObject obj;

    cur.expect('{');
    if (!cur.consume('}')) {
        do {
            cur.skip_ws();
            std::string key = cur.parse_string();
            cur.expect(':');
            obj.fields_[key] = cur.parse_value();
        } while (cur.consume(','));
        cur.expect('}');
    }

    cur.skip_ws();
    if (!cur.at_end()) {
        throw ParseError("trailing characters after object");
    }
    return obj;
}

std::vector<std::string> split_array(const std::string& text) {
    Cursor cur(text);
    std::vector<std::string> out;

    cur.expect('[');
    if (!cur.consume(']')) {
        do {
            Value v = cur.parse_value();
            out.push_back(v.kind == Kind::String ? quote(v.text) : v.text);
        } while (cur.consume(','));
        cur.expect(']');
    }

    cur.skip_ws();
    if (!cur.at_end()) {
        throw ParseError("trailing characters after array");
    }
    return out;
}

std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

std::string format_double(double v) {
    if (!std::isfinite(v)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

double to_double(const Value& v) {
    if (v.kind != Kind::Number && v.kind != Kind::String) {
        throw ParseError("value is not numeric");
    }
    errno = 0;
    char* end = nullptr;
    const double d = std::strtod(v.text.c_str(), &end);
    if (errno == ERANGE || end == v.text.c_str() || *end != '\0') {
        throw ParseError("not a number: " + v.text);
    }
    return d;
}

} // namespace arbscan::json
