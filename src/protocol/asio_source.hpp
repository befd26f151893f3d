#pragma once

#include "protocol/byte_source.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace resp::protocol {

// ── AsioStreamSource ─────────────────────────────────────────────────────────
//
// Adapts any blocking Boost.Asio SyncReadStream (tcp/local socket,
// posix::stream_descriptor, ...) to ByteSource.
//
// asio::error::eof is end of stream; every other boost::system::error_code is
// passed through as the read failure, so callers see the original errno.
// The stream is borrowed and must outlive the source.

template <typename SyncReadStream>
class AsioStreamSource final : public ByteSource {
public:
    explicit AsioStreamSource(SyncReadStream& stream) noexcept : stream_(stream) {}

    [[nodiscard]] std::size_t read(std::span<uint8_t> buffer, std::error_code& ec) override {
        ec.clear();
        if (buffer.empty()) {
            return 0;
        }

        boost::system::error_code bec;
        const std::size_t n =
            stream_.read_some(boost::asio::buffer(buffer.data(), buffer.size()), bec);

        if (bec == boost::asio::error::eof) {
            return 0;
        }
        if (bec) {
            ec = bec;
            return 0;
        }
        return n;
    }

private:
    SyncReadStream& stream_;
};

} // namespace resp::protocol
