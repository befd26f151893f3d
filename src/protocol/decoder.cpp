#include "protocol/decoder.hpp"

#include <boost/locale/utf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace resp::protocol {

namespace {

// Upper bound on how much payload or element storage is committed ahead of the
// bytes that actually arrive. Declared sizes alone never drive allocation.
constexpr std::size_t kReadChunk        = 64 * 1024;
constexpr std::size_t kElementPrealloc  = 1024;

// An array whose header has been read but whose elements are still arriving.
struct PendingArray {
    std::size_t expected;
    std::vector<Value> elements;
};

bool is_valid_utf8(std::string_view text) {
    using traits = boost::locale::utf::utf_traits<char>;

    auto it = text.begin();
    const auto end = text.end();
    while (it != end) {
        const auto cp = traits::decode(it, end);
        if (cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete) {
            return false;
        }
    }
    return true;
}

std::string describe_tag(uint8_t tag) {
    if (std::isprint(tag)) {
        return fmt::format("0x{:02x} ('{}')", tag, static_cast<char>(tag));
    }
    return fmt::format("0x{:02x}", tag);
}

} // anonymous namespace

// ── DecodeError ──────────────────────────────────────────────────────────────

std::string_view to_string(DecodeErrorKind kind) noexcept {
    switch (kind) {
        case DecodeErrorKind::EndOfStream:  return "EndOfStream";
        case DecodeErrorKind::InvalidValue: return "InvalidValue";
        case DecodeErrorKind::IoError:      return "IoError";
    }
    return "Unknown";
}

std::string DecodeError::describe() const {
    switch (kind) {
        case DecodeErrorKind::EndOfStream:
            return "unexpected end of stream";
        case DecodeErrorKind::InvalidValue:
            return "invalid value: " + detail;
        case DecodeErrorKind::IoError:
            return "I/O error: " + io_error.message();
    }
    return detail;
}

// ── Decoder ──────────────────────────────────────────────────────────────────

Decoder::Decoder(ByteSource& source, DecoderLimits limits) noexcept
    : source_(source), limits_(limits) {}

DecodeResult Decoder::decode() {
    error_.reset();

    std::vector<PendingArray> pending;

    const auto failed = [&]() -> DecodeResult {
        spdlog::debug("resp: decode failed at depth {}: {}",
                      pending.size(), error_->describe());
        return std::move(*error_);
    };

    while (true) {
        uint8_t tag = 0;
        if (!read_byte(tag)) {
            return failed();
        }

        std::optional<Value> value;

        switch (tag) {
            case wire::kTagString: {
                std::string text;
                if (!read_simple(text, "simple string")) return failed();
                value.emplace(SimpleString{std::move(text)});
                break;
            }
            case wire::kTagError: {
                std::string message;
                if (!read_simple(message, "simple error")) return failed();
                value.emplace(SimpleError{std::move(message)});
                break;
            }
            case wire::kTagInteger: {
                int64_t n = 0;
                if (!read_integer(n, "integer")) return failed();
                value.emplace(Integer{n});
                break;
            }
            case wire::kTagBulkString: {
                std::vector<uint8_t> bytes;
                if (!read_bulk(bytes)) return failed();
                value.emplace(BulkString{std::move(bytes)});
                break;
            }
            case wire::kTagArray: {
                int64_t count = 0;
                if (!read_count(count)) return failed();

                // Empty arrays complete immediately and never occupy a level.
                if (count == 0) {
                    value.emplace(Array{});
                    break;
                }

                if (pending.size() >= limits_.max_nesting_depth) {
                    fail_invalid(fmt::format("array nesting exceeds max depth {}",
                                             limits_.max_nesting_depth));
                    return failed();
                }

                spdlog::trace("resp: array of {} elements at depth {}", count, pending.size());

                PendingArray frame{static_cast<std::size_t>(count), {}};
                frame.elements.reserve(std::min(frame.expected, kElementPrealloc));
                pending.push_back(std::move(frame));
                continue;
            }
            default:
                fail_invalid("invalid type tag " + describe_tag(tag));
                return failed();
        }

        // Fold the finished value into its parent; every array it completes
        // becomes the finished value one level up.
        while (!pending.empty()) {
            auto& top = pending.back();
            top.elements.push_back(std::move(*value));
            if (top.elements.size() < top.expected) {
                break;
            }
            value.emplace(Array{std::move(top.elements)});
            pending.pop_back();
        }

        if (pending.empty()) {
            return std::move(*value);
        }
    }
}

// ── Byte reads ───────────────────────────────────────────────────────────────

bool Decoder::read_byte(uint8_t& out) {
    return read_exact(std::span<uint8_t>{&out, 1});
}

bool Decoder::read_exact(std::span<uint8_t> out) {
    std::size_t filled = 0;
    while (filled < out.size()) {
        std::error_code ec;
        const std::size_t n = source_.read(out.subspan(filled), ec);
        if (ec) {
            return fail_io(ec);
        }
        if (n == 0) {
            return fail_end_of_stream();
        }
        filled += n;
    }
    return true;
}

bool Decoder::expect_lf(std::string_view what) {
    uint8_t b = 0;
    if (!read_byte(b)) {
        return false;
    }
    if (b != wire::kLF) {
        return fail_invalid(fmt::format("{} does not end with \\r\\n", what));
    }
    return true;
}

// ── Line-based routines ──────────────────────────────────────────────────────

// Collects bytes up to the next \r, then requires \n. The terminator is not
// part of `out`.
bool Decoder::read_line(std::string& out, std::string_view what) {
    out.clear();
    while (true) {
        uint8_t b = 0;
        if (!read_byte(b)) {
            return false;
        }
        if (b == wire::kCR) {
            return expect_lf(what);
        }
        if (out.size() >= limits_.max_line_length) {
            return fail_invalid(fmt::format("{} exceeds max line length {}",
                                            what, limits_.max_line_length));
        }
        out.push_back(static_cast<char>(b));
    }
}

// Simple strings and errors: no bare \n before the terminator, UTF-8 only.
bool Decoder::read_simple(std::string& out, std::string_view what) {
    out.clear();
    while (true) {
        uint8_t b = 0;
        if (!read_byte(b)) {
            return false;
        }
        if (b == wire::kLF) {
            return fail_invalid(fmt::format("{} contains \\n", what));
        }
        if (b == wire::kCR) {
            break;
        }
        if (out.size() >= limits_.max_line_length) {
            return fail_invalid(fmt::format("{} exceeds max line length {}",
                                            what, limits_.max_line_length));
        }
        out.push_back(static_cast<char>(b));
    }

    if (!expect_lf(what)) {
        return false;
    }
    if (!is_valid_utf8(out)) {
        return fail_invalid(fmt::format("{} is not valid UTF-8", what));
    }
    return true;
}

bool Decoder::read_integer(int64_t& out, std::string_view what) {
    std::string text;
    if (!read_line(text, what)) {
        return false;
    }

    const char* first = text.data();
    const char* last  = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return fail_invalid(fmt::format("cannot parse '{}' as {}", text, what));
    }
    return true;
}

bool Decoder::read_length(int64_t& out, int64_t max, std::string_view what) {
    const std::string label = fmt::format("{} length", what);
    if (!read_integer(out, label)) {
        return false;
    }
    if (out < 0) {
        return fail_invalid(fmt::format("negative {} {}", label, out));
    }
    if (out > max) {
        return fail_invalid(fmt::format("{} {} exceeds limit {}", label, out, max));
    }
    return true;
}

// Unlike bulk lengths, a negative array count is an array with no elements.
bool Decoder::read_count(int64_t& out) {
    if (!read_integer(out, "array length")) {
        return false;
    }
    if (out < 0) {
        out = 0;
    }
    if (out > limits_.max_array_length) {
        return fail_invalid(fmt::format("array length {} exceeds limit {}",
                                        out, limits_.max_array_length));
    }
    return true;
}

bool Decoder::read_bulk(std::vector<uint8_t>& out) {
    int64_t length = 0;
    if (!read_length(length, limits_.max_bulk_length, "bulk string")) {
        return false;
    }

    // Grow in chunks as bytes arrive rather than trusting the declared size.
    out.clear();
    auto remaining = static_cast<std::size_t>(length);
    while (remaining > 0) {
        const std::size_t chunk = std::min(remaining, kReadChunk);
        const std::size_t offset = out.size();
        out.resize(offset + chunk);
        if (!read_exact(std::span<uint8_t>{out.data() + offset, chunk})) {
            return false;
        }
        remaining -= chunk;
    }

    uint8_t b = 0;
    if (!read_byte(b)) {
        return false;
    }
    if (b != wire::kCR) {
        return fail_invalid("bulk string payload does not end with \\r\\n");
    }
    return expect_lf("bulk string payload");
}

// ── Failure helpers ──────────────────────────────────────────────────────────

bool Decoder::fail_end_of_stream() {
    error_ = DecodeError{DecodeErrorKind::EndOfStream, {}, {}};
    return false;
}

bool Decoder::fail_invalid(std::string detail) {
    error_ = DecodeError{DecodeErrorKind::InvalidValue, std::move(detail), {}};
    return false;
}

bool Decoder::fail_io(std::error_code ec) {
    error_ = DecodeError{DecodeErrorKind::IoError, ec.message(), ec};
    return false;
}

// ── Entry points ─────────────────────────────────────────────────────────────

DecodeResult decode_from_stream(ByteSource& source, const DecoderLimits& limits) {
    Decoder decoder{source, limits};
    return decoder.decode();
}

DecodeResult decode_from_stream(std::istream& in, const DecoderLimits& limits) {
    IstreamSource source{in};
    return decode_from_stream(source, limits);
}

DecodeResult decode_from_bytes(std::span<const uint8_t> bytes, const DecoderLimits& limits) {
    MemorySource source{bytes};
    return decode_from_stream(source, limits);
}

DecodeResult decode_from_text(std::string_view text, const DecoderLimits& limits) {
    MemorySource source{text};
    return decode_from_stream(source, limits);
}

} // namespace resp::protocol
