#include "protocol/value.hpp"

#include <cstdio>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace resp::protocol {

namespace {

// Append `data` quoted, escaping anything that would break a single line.
void append_quoted(std::string& out, std::string_view data) {
    out.push_back('"');
    for (unsigned char c : data) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\r': out += "\\r";  break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    char hex[5];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                    out += hex;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
}

void append_debug(std::string& out, const Value& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                out += "String(";
                append_quoted(out, v.text);
                out += ')';
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                out += "Error(";
                append_quoted(out, v.message);
                out += ')';
            } else if constexpr (std::is_same_v<T, Integer>) {
                out += "Integer(" + std::to_string(v.value) + ")";
            } else if constexpr (std::is_same_v<T, BulkString>) {
                out += "BulkString(";
                append_quoted(out, v.view());
                out += ')';
            } else if constexpr (std::is_same_v<T, Array>) {
                out += "Array([";
                for (std::size_t i = 0; i < v.elements.size(); ++i) {
                    if (i > 0) out += ", ";
                    append_debug(out, v.elements[i]);
                }
                out += "])";
            }
        },
        value.variant());
}

// Render one value as redis-cli does. Arrays produce one line per leaf; nested
// elements are indented under their "N) " prefix.
std::vector<std::string> reply_lines(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::vector<std::string> {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, SimpleString>) {
                std::string line;
                append_quoted(line, v.text);
                return {std::move(line)};
            } else if constexpr (std::is_same_v<T, SimpleError>) {
                return {"(error) " + v.message};
            } else if constexpr (std::is_same_v<T, Integer>) {
                return {"(integer) " + std::to_string(v.value)};
            } else if constexpr (std::is_same_v<T, BulkString>) {
                std::string line;
                append_quoted(line, v.view());
                return {std::move(line)};
            } else if constexpr (std::is_same_v<T, Array>) {
                if (v.elements.empty()) {
                    return {"(empty array)"};
                }
                // All prefixes share the width of the widest index.
                const std::size_t width = std::to_string(v.elements.size()).size();

                std::vector<std::string> lines;
                for (std::size_t i = 0; i < v.elements.size(); ++i) {
                    std::string prefix = std::to_string(i + 1);
                    prefix.insert(0, width - prefix.size(), ' ');
                    prefix += ") ";
                    const std::string pad(prefix.size(), ' ');

                    auto nested = reply_lines(v.elements[i]);
                    for (std::size_t j = 0; j < nested.size(); ++j) {
                        lines.push_back((j == 0 ? prefix : pad) + nested[j]);
                    }
                }
                return lines;
            }
        },
        value.variant());
}

} // anonymous namespace

BulkString make_bulk(std::string_view data) {
    return BulkString{std::vector<uint8_t>(data.begin(), data.end())};
}

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::String:     return "String";
        case ValueType::Error:      return "Error";
        case ValueType::Integer:    return "Integer";
        case ValueType::BulkString: return "BulkString";
        case ValueType::Array:      return "Array";
    }
    return "Unknown";
}

std::string to_string(const Value& value) {
    std::string out;
    append_debug(out, value);
    return out;
}

std::string format_reply(const Value& value) {
    std::string out;
    for (const auto& line : reply_lines(value)) {
        out += line;
        out += '\n';
    }
    if (!out.empty()) {
        out.pop_back();
    }
    return out;
}

void PrintTo(const Value& value, std::ostream* os) {
    *os << to_string(value);
}

} // namespace resp::protocol
