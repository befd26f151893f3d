#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string_view>
#include <system_error>

namespace resp::protocol {

// ── ByteSource ───────────────────────────────────────────────────────────────
//
// Blocking, sequential byte input for the Decoder.
//
// read() fills at most buffer.size() bytes and returns how many were read.
// A return of 0 with `ec` clear means end of stream. On failure `ec` is set
// and the return value is 0. Implementations never return more bytes than
// asked for, so a reader that requests exactly what it needs never consumes
// past the end of a message.
//
// Thread-safety: NOT thread-safe. One decode call owns a source at a time.

class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::size_t read(std::span<uint8_t> buffer, std::error_code& ec) = 0;
};

// ── MemorySource ─────────────────────────────────────────────────────────────
//
// Cursor over a borrowed byte span. The span must outlive the source.

class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::span<const uint8_t> data) noexcept : data_(data) {}

    explicit MemorySource(std::string_view text) noexcept
        : data_(reinterpret_cast<const uint8_t*>(text.data()), text.size()) {}

    [[nodiscard]] std::size_t read(std::span<uint8_t> buffer, std::error_code& ec) override;

    // Number of bytes consumed so far.
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
};

// ── IstreamSource ────────────────────────────────────────────────────────────
//
// Adapts a std::istream. Hitting eof is end of stream, also on streams with
// exceptions() enabled; badbit (or an exception thrown by the underlying
// streambuf) is reported as std::errc::io_error.

class IstreamSource final : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) noexcept : in_(in) {}

    [[nodiscard]] std::size_t read(std::span<uint8_t> buffer, std::error_code& ec) override;

private:
    std::istream& in_;
};

} // namespace resp::protocol
