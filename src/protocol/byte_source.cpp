#include "protocol/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <exception>

namespace resp::protocol {

// ── MemorySource ─────────────────────────────────────────────────────────────

std::size_t MemorySource::read(std::span<uint8_t> buffer, std::error_code& ec) {
    ec.clear();
    const std::size_t n = std::min(buffer.size(), remaining());
    if (n > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

// ── IstreamSource ────────────────────────────────────────────────────────────

std::size_t IstreamSource::read(std::span<uint8_t> buffer, std::error_code& ec) {
    ec.clear();
    if (buffer.empty()) {
        return 0;
    }

    // With exceptions() enabled, a short read at end of file throws as well as
    // a failing streambuf does. Only badbit is a read failure; eof keeps
    // whatever was read before it.
    try {
        in_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    } catch (const std::exception&) {
        if (in_.bad() || !in_.eof()) {
            ec = std::make_error_code(std::errc::io_error);
            return 0;
        }
        return static_cast<std::size_t>(in_.gcount());
    }

    const auto n = static_cast<std::size_t>(in_.gcount());

    // A short read only sets eof|fail; the next call then reads nothing, which
    // is the end-of-stream signal.
    if (in_.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return 0;
    }
    return n;
}

} // namespace resp::protocol
