#pragma once

#include "protocol/byte_source.hpp"
#include "protocol/value.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace resp::protocol {

// ── Wire constants ───────────────────────────────────────────────────────────

namespace wire {

inline constexpr uint8_t kTagString     = '+';
inline constexpr uint8_t kTagError      = '-';
inline constexpr uint8_t kTagInteger    = ':';
inline constexpr uint8_t kTagBulkString = '$';
inline constexpr uint8_t kTagArray      = '*';

inline constexpr uint8_t kCR = '\r';
inline constexpr uint8_t kLF = '\n';

} // namespace wire

// ── Errors ───────────────────────────────────────────────────────────────────

enum class DecodeErrorKind : uint8_t {
    EndOfStream  = 0, // source ran out before the current token was complete
    InvalidValue = 1, // bytes violate the grammar or a DecoderLimits bound
    IoError      = 2, // the source reported a read failure
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::InvalidValue;
    std::string detail;        // empty for EndOfStream
    std::error_code io_error;  // set only for IoError

    // One-line description, e.g. "invalid value: invalid type tag 0x58 ('X')".
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] std::string_view to_string(DecodeErrorKind kind) noexcept;

using DecodeResult = std::variant<Value, DecodeError>;

// ── Limits ───────────────────────────────────────────────────────────────────
//
// Bounds on what a single message may declare. Anything beyond them fails with
// InvalidValue before memory is committed for it.

struct DecoderLimits {
    std::size_t max_line_length   = 64 * 1024;          // simple string/error/integer line
    int64_t     max_bulk_length   = 512 * 1024 * 1024;  // bytes in one bulk string
    int64_t     max_array_length  = 1024 * 1024;        // elements in one array
    std::size_t max_nesting_depth = 512;                // arrays open at once
};

// ── Decoder ──────────────────────────────────────────────────────────────────
//
// Reads exactly one RESP message from a ByteSource per decode() call.
//
// Never reads past the terminator of the message it returns. On failure the
// source is left wherever the failure happened; there is no rollback.
// Nested arrays are tracked on an explicit stack of pending frames, so deeply
// nested input costs heap, not call stack.
//
// Thread-safety: NOT thread-safe. Independent decoders on independent
// sources may run on different threads.

class Decoder {
public:
    explicit Decoder(ByteSource& source, DecoderLimits limits = {}) noexcept;

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    [[nodiscard]] DecodeResult decode();

    [[nodiscard]] const DecoderLimits& limits() const noexcept { return limits_; }

private:
    // Each routine returns false after recording the failure in error_.
    [[nodiscard]] bool read_byte(uint8_t& out);
    [[nodiscard]] bool read_exact(std::span<uint8_t> out);
    [[nodiscard]] bool expect_lf(std::string_view what);
    [[nodiscard]] bool read_line(std::string& out, std::string_view what);
    [[nodiscard]] bool read_simple(std::string& out, std::string_view what);
    [[nodiscard]] bool read_integer(int64_t& out, std::string_view what);
    [[nodiscard]] bool read_length(int64_t& out, int64_t max, std::string_view what);
    [[nodiscard]] bool read_count(int64_t& out);
    [[nodiscard]] bool read_bulk(std::vector<uint8_t>& out);

    bool fail_end_of_stream();
    bool fail_invalid(std::string detail);
    bool fail_io(std::error_code ec);

    ByteSource& source_;
    DecoderLimits limits_;
    std::optional<DecodeError> error_;
};

// ── Entry points ─────────────────────────────────────────────────────────────

// Decode one message from `source`, leaving any following bytes unread.
[[nodiscard]] DecodeResult decode_from_stream(ByteSource& source,
                                              const DecoderLimits& limits = {});

// Same, reading from a std::istream.
[[nodiscard]] DecodeResult decode_from_stream(std::istream& in,
                                              const DecoderLimits& limits = {});

// Decode one message from an in-memory buffer.
[[nodiscard]] DecodeResult decode_from_bytes(std::span<const uint8_t> bytes,
                                             const DecoderLimits& limits = {});

// Decode one message from text, taken as its UTF-8 bytes.
[[nodiscard]] DecodeResult decode_from_text(std::string_view text,
                                            const DecoderLimits& limits = {});

} // namespace resp::protocol
