#include "protocol/asio_source.hpp"
#include "protocol/byte_source.hpp"
#include "protocol/decoder.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace asio = boost::asio;

namespace resp::protocol {

namespace {

std::string read_all(ByteSource& source, std::size_t chunk) {
    std::string out;
    std::vector<uint8_t> buf(chunk);
    while (true) {
        std::error_code ec;
        const auto n = source.read(buf, ec);
        EXPECT_FALSE(ec) << ec.message();
        if (n == 0) break;
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

// Streambuf that yields `data` and then throws on the next underflow, the way
// a streambuf over a failing device does.
class BrokenStreambuf final : public std::streambuf {
public:
    explicit BrokenStreambuf(std::string data) : data_(std::move(data)) {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("device failure");
    }

private:
    std::string data_;
};

} // anonymous namespace

// ── MemorySource ──────────────────────────────────────────────────────────────

TEST(MemorySourceTest, ReadsInChunksAndTracksPosition) {
    MemorySource source{std::string_view{"abcdef"}};

    std::array<uint8_t, 4> buf{};
    std::error_code ec;
    EXPECT_EQ(source.read(buf, ec), 4u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(source.position(), 4u);
    EXPECT_EQ(source.remaining(), 2u);

    EXPECT_EQ(source.read(buf, ec), 2u);
    EXPECT_EQ(buf[0], 'e');
    EXPECT_EQ(buf[1], 'f');

    EXPECT_EQ(source.read(buf, ec), 0u);  // end of stream
    EXPECT_FALSE(ec);
}

TEST(MemorySourceTest, EmptyBufferReadsNothing) {
    MemorySource source{std::string_view{"abc"}};
    std::error_code ec;
    EXPECT_EQ(source.read(std::span<uint8_t>{}, ec), 0u);
    EXPECT_EQ(source.position(), 0u);
}

TEST(MemorySourceTest, FromByteSpan) {
    const std::array<uint8_t, 3> data{0x00, 0xFF, 0x7F};
    MemorySource source{std::span<const uint8_t>{data}};
    EXPECT_EQ(read_all(source, 2), std::string("\x00\xFF\x7F", 3));
}

// ── IstreamSource ─────────────────────────────────────────────────────────────

TEST(IstreamSourceTest, ReadsUntilEof) {
    std::istringstream in{"hello world"};
    IstreamSource source{in};
    EXPECT_EQ(read_all(source, 3), "hello world");

    // Stays at end of stream on further reads.
    std::array<uint8_t, 1> b{};
    std::error_code ec;
    EXPECT_EQ(source.read(b, ec), 0u);
    EXPECT_FALSE(ec);
}

TEST(IstreamSourceTest, DoesNotReadAheadOfRequest) {
    std::istringstream in{"abcdef"};
    IstreamSource source{in};

    std::array<uint8_t, 2> buf{};
    std::error_code ec;
    ASSERT_EQ(source.read(buf, ec), 2u);

    std::string rest;
    std::getline(in, rest);
    EXPECT_EQ(rest, "cdef");
}

TEST(IstreamSourceTest, ThrowingStreamKeepsPartialReadAtEof) {
    std::istringstream in{"hello"};
    in.exceptions(std::ios::failbit | std::ios::badbit);
    IstreamSource source{in};

    std::array<uint8_t, 8> buf{};
    std::error_code ec;
    ASSERT_EQ(source.read(buf, ec), 5u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(std::string(buf.begin(), buf.begin() + 5), "hello");

    EXPECT_EQ(source.read(buf, ec), 0u);
    EXPECT_FALSE(ec);
}

TEST(IstreamSourceTest, ThrowingStreamRunningDryIsEndOfStream) {
    for (std::string_view wire : {std::string_view{""},
                                  std::string_view{":8122\r"},
                                  std::string_view{"$5\r\nab"}}) {
        std::istringstream in{std::string{wire}};
        in.exceptions(std::ios::failbit | std::ios::badbit);

        auto result = decode_from_stream(in);
        ASSERT_TRUE(std::holds_alternative<DecodeError>(result)) << wire;
        EXPECT_EQ(std::get<DecodeError>(result).kind, DecodeErrorKind::EndOfStream) << wire;
    }
}

TEST(IstreamSourceTest, ThrowingStreamDecodesCompleteMessage) {
    std::istringstream in{"*2\r\n$4\r\nECHO\r\n:1\r\n"};
    in.exceptions(std::ios::failbit | std::ios::badbit);

    auto result = decode_from_stream(in);
    ASSERT_TRUE(std::holds_alternative<Value>(result));
    Value expected = Array{{make_bulk("ECHO"), Integer{1}}};
    EXPECT_EQ(std::get<Value>(result), expected);
}

TEST(IstreamSourceTest, StreambufFailureWithExceptionsIsIoError) {
    BrokenStreambuf sb{"+O"};
    std::istream in{&sb};
    in.exceptions(std::ios::failbit | std::ios::badbit);

    auto result = decode_from_stream(in);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(result));
    EXPECT_EQ(std::get<DecodeError>(result).kind, DecodeErrorKind::IoError);
}

TEST(IstreamSourceTest, StreambufFailureIsIoError) {
    BrokenStreambuf sb{"ab"};
    std::istream in{&sb};
    IstreamSource source{in};

    std::array<uint8_t, 4> buf{};
    std::error_code ec;
    const auto n = source.read(buf, ec);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(ec, std::make_error_code(std::errc::io_error));
}

TEST(IstreamSourceTest, DecoderReportsStreambufFailure) {
    BrokenStreambuf sb{"*2\r\n:1\r\n"};
    std::istream in{&sb};

    auto result = decode_from_stream(in);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(result));
    EXPECT_EQ(std::get<DecodeError>(result).kind, DecodeErrorKind::IoError);
}

// ── AsioStreamSource ──────────────────────────────────────────────────────────

class AsioStreamSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        asio::local::connect_pair(writer_, reader_);
    }

    void send(std::string_view data) {
        asio::write(writer_, asio::buffer(data.data(), data.size()));
    }

    asio::io_context ioc_;
    asio::local::stream_protocol::socket writer_{ioc_};
    asio::local::stream_protocol::socket reader_{ioc_};
};

TEST_F(AsioStreamSourceTest, DecodesFromSocket) {
    send("*2\r\n$4\r\nECHO\r\n$3\r\nhey\r\n");

    AsioStreamSource source{reader_};
    auto result = decode_from_stream(source);

    ASSERT_TRUE(std::holds_alternative<Value>(result));
    Value expected = Array{{make_bulk("ECHO"), make_bulk("hey")}};
    EXPECT_EQ(std::get<Value>(result), expected);
}

TEST_F(AsioStreamSourceTest, LeavesNextMessageInSocket) {
    send(":1\r\n:2\r\n");

    AsioStreamSource source{reader_};
    auto first  = decode_from_stream(source);
    auto second = decode_from_stream(source);

    ASSERT_TRUE(std::holds_alternative<Value>(first));
    ASSERT_TRUE(std::holds_alternative<Value>(second));
    EXPECT_EQ(std::get<Value>(first), Value{Integer{1}});
    EXPECT_EQ(std::get<Value>(second), Value{Integer{2}});
}

TEST_F(AsioStreamSourceTest, PeerCloseIsEndOfStream) {
    send("$5\r\nhel");
    writer_.close();

    AsioStreamSource source{reader_};
    auto result = decode_from_stream(source);

    ASSERT_TRUE(std::holds_alternative<DecodeError>(result));
    EXPECT_EQ(std::get<DecodeError>(result).kind, DecodeErrorKind::EndOfStream);
}

TEST_F(AsioStreamSourceTest, ClosedSocketIsIoError) {
    reader_.close();

    AsioStreamSource source{reader_};
    std::array<uint8_t, 1> b{};
    std::error_code ec;
    EXPECT_EQ(source.read(b, ec), 0u);
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec.value(), EBADF);

    auto result = decode_from_stream(source);
    ASSERT_TRUE(std::holds_alternative<DecodeError>(result));
    EXPECT_EQ(std::get<DecodeError>(result).kind, DecodeErrorKind::IoError);
}

} // namespace resp::protocol
