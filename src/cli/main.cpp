#include "common/decode_config.hpp"
#include "common/logger.hpp"
#include "protocol/asio_source.hpp"
#include "protocol/byte_source.hpp"
#include "protocol/decoder.hpp"
#include "protocol/value.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

#include <unistd.h>

namespace asio = boost::asio;

namespace {

constexpr int kExitDecodeError = 2;

// Decode one message from stdin. Goes through a stream_descriptor so pipes,
// terminals and sockets handed to us as fd 0 all read the same way.
resp::protocol::DecodeResult decode_stdin(const resp::protocol::DecoderLimits& limits) {
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "dup(stdin)");
    }

    asio::io_context ioc;
    asio::posix::stream_descriptor in{ioc, fd};

    resp::protocol::AsioStreamSource source{in};
    return resp::protocol::decode_from_stream(source, limits);
}

resp::protocol::DecodeResult decode_file(const std::string& path,
                                         const resp::protocol::DecoderLimits& limits) {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        throw std::runtime_error("Cannot open input file '" + path + "'");
    }
    return resp::protocol::decode_from_stream(file, limits);
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    resp::DecodeConfig cfg;
    try {
        cfg = resp::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    resp::init_default_logger(resp::parse_log_level(cfg.log_level));

    const std::string source_label = cfg.eval ? "--eval" : cfg.input;
    spdlog::debug("resp-decode reading from {} (max line {}, max bulk {}, max array {}, max depth {})",
                  source_label, cfg.limits.max_line_length, cfg.limits.max_bulk_length,
                  cfg.limits.max_array_length, cfg.limits.max_nesting_depth);

    resp::protocol::DecodeResult result = resp::protocol::DecodeError{};
    try {
        if (cfg.eval) {
            result = resp::protocol::decode_from_text(*cfg.eval, cfg.limits);
        } else if (cfg.input == "-") {
            result = decode_stdin(cfg.limits);
        } else {
            result = decode_file(cfg.input, cfg.limits);
        }
    } catch (const std::exception& ex) {
        spdlog::error("resp-decode: {}", ex.what());
        return 1;
    }

    if (const auto* err = std::get_if<resp::protocol::DecodeError>(&result)) {
        fprintf(stderr, "(decode error) %s\n", err->describe().c_str());
        return kExitDecodeError;
    }

    const auto& value = std::get<resp::protocol::Value>(result);
    const std::string out = cfg.format == resp::OutputFormat::Debug
        ? resp::protocol::to_string(value)
        : resp::protocol::format_reply(value);

    fprintf(stdout, "%s\n", out.c_str());
    return 0;
}
