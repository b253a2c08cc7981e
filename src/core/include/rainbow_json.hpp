#pragma once

/**
 * @file rainbow_json.hpp
 * @brief Minimal strict JSON (RFC 8259) reader and string quoting
 *
 * Enough for the JSON metadata carrier: objects keep member order,
 * duplicate keys are rejected, numbers keep their source text.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rainbow {
namespace json {

class Value {
public:
    enum class Type { NUL, BOOL, NUMBER, STRING, ARRAY, OBJECT };

    Value() = default;

    Type type() const { return type_; }
    bool is_string() const { return type_ == Type::STRING; }
    bool is_number() const { return type_ == Type::NUMBER; }
    bool is_object() const { return type_ == Type::OBJECT; }

    const std::string& as_string() const { return text_; }      // STRING value / NUMBER source text
    bool as_bool() const { return flag_; }
    const std::vector<Value>& items() const { return items_; }
    const std::vector<std::pair<std::string, Value>>& members() const { return members_; }

    /// Non-negative integer value of a NUMBER written without fraction/exponent.
    std::optional<uint64_t> as_uint() const;

    /// Member lookup for OBJECT values; nullptr when absent or not an object.
    const Value* find(const std::string& key) const;

private:
    friend class Reader;

    Type type_ = Type::NUL;
    bool flag_ = false;
    std::string text_;
    std::vector<Value> items_;
    std::vector<std::pair<std::string, Value>> members_;
};

/// Parse a complete document. Throws FormatError.
Value parse(std::string_view input);

/// JSON string literal (with quotes) for arbitrary UTF-8 text.
std::string quote(std::string_view raw);

} // namespace json
} // namespace rainbow
