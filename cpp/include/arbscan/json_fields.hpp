#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Minimal JSON field reader/writer. Boost 1.74 ships no JSON library, so
// exchange payloads and journal lines are read one object level at a time:
// nested objects and arrays are kept as raw text and parsed on demand.
namespace arbscan::json {

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error("JSON parse error: " + msg) {}
};

enum class Kind {
    String,
    Number,
    Bool,
    Null,
    Object,
    Array
};

struct Value {
    Kind kind = Kind::Null;
    // Unescaped contents for strings, raw source text otherwise
    std::string text;
};

class FlatObject {
public:
    bool has(const std::string& key) const;

    const Value* find(const std::string& key) const;

    // Throw ParseError when the key is missing or has the wrong kind
    std::string get_string(const std::string& key) const;
    double get_double(const std::string& key) const;
    std::int64_t get_int64(const std::string& key) const;
    std::uint64_t get_uint64(const std::string& key) const;
    std::string get_raw(const std::string& key) const;

    std::optional<std::string> find_string(const std::string& key) const;

    const std::map<std::string, Value>& fields() const { return fields_; }

private:
    friend FlatObject parse_object(const std::string& text);

    std::map<std::string, Value> fields_;
};

FlatObject parse_object(const std::string& text);

// Raw text of each element of a JSON array
std::vector<std::string> split_array(const std::string& text);

// Quoted, escaped string literal
std::string quote(const std::string& s);

// Shortest text that reads back to the same double
std::string format_double(double v);

// Accepts a JSON number or a string holding one (exchanges quote prices as strings)
double to_double(const Value& v);

} // namespace arbscan::json
