#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace resp::protocol {

class Value;

// ── Variants ──────────────────────────────────────────────────────────────────
//
// One plain struct per RESP type; Value wraps them in a std::variant so callers
// can std::visit over a decoded tree without inheritance.

// `+OK\r\n`
struct SimpleString {
    std::string text;

    bool operator==(const SimpleString&) const = default;
};

// `-ERR unknown command\r\n`
struct SimpleError {
    std::string message;

    bool operator==(const SimpleError&) const = default;
};

// `:1000\r\n`
struct Integer {
    int64_t value = 0;

    bool operator==(const Integer&) const = default;
};

// `$5\r\nhello\r\n` – payload is opaque, may contain any byte.
struct BulkString {
    std::vector<uint8_t> bytes;

    // View the payload as characters, without validation or copying.
    [[nodiscard]] std::string_view view() const noexcept {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    bool operator==(const BulkString&) const = default;
};

// `*2\r\n...` – elements may be any Value, including nested arrays.
struct Array {
    std::vector<Value> elements;

    friend bool operator==(const Array& lhs, const Array& rhs);
};

enum class ValueType : uint8_t {
    String     = 0,
    Error      = 1,
    Integer    = 2,
    BulkString = 3,
    Array      = 4,
};

// ── Value ─────────────────────────────────────────────────────────────────────
//
// A decoded RESP value. Owns its whole subtree; nothing in it refers back to
// the byte source it was decoded from.

class Value {
public:
    using Variant = std::variant<SimpleString, SimpleError, Integer, BulkString, Array>;

    Value(SimpleString v) : data_(std::move(v)) {}
    Value(SimpleError v) : data_(std::move(v)) {}
    Value(Integer v) : data_(v) {}
    Value(BulkString v) : data_(std::move(v)) {}
    Value(Array v) : data_(std::move(v)) {}

    [[nodiscard]] ValueType type() const noexcept {
        return static_cast<ValueType>(data_.index());
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    // Throws std::bad_variant_access if the value holds another type.
    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data_);
    }

    template <typename T>
    [[nodiscard]] T& as() {
        return std::get<T>(data_);
    }

    [[nodiscard]] const Variant& variant() const noexcept { return data_; }

    friend bool operator==(const Value& lhs, const Value& rhs) {
        return lhs.data_ == rhs.data_;
    }

private:
    Variant data_;
};

inline bool operator==(const Array& lhs, const Array& rhs) {
    return lhs.elements == rhs.elements;
}

// ── Construction helpers ──────────────────────────────────────────────────────

[[nodiscard]] BulkString make_bulk(std::string_view data);

// ── Formatting ────────────────────────────────────────────────────────────────

// "String", "Error", "Integer", "BulkString" or "Array".
[[nodiscard]] std::string_view type_name(ValueType type) noexcept;

// Structural debug form, e.g. Array([BulkString("ECHO"), Integer(5)]).
// Non-printable bytes are escaped, so the result is always a single line.
[[nodiscard]] std::string to_string(const Value& value);

// redis-cli style rendering used by resp-decode:
//   "hello" / (error) ERR x / (integer) 5 / (empty array) /
//   1) "a"
//   2) 1) (integer) 1
//      2) (integer) 2
[[nodiscard]] std::string format_reply(const Value& value);

// Hook picked up by GoogleTest when printing values in failed assertions.
void PrintTo(const Value& value, std::ostream* os);

} // namespace resp::protocol
