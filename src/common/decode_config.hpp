#pragma once

#include "protocol/decoder.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace resp {

// ── OutputFormat ──────────────────────────────────────────────────────────────

enum class OutputFormat {
    Reply, // redis-cli style, protocol::format_reply
    Debug, // structural, protocol::to_string
};

// ── DecodeConfig ──────────────────────────────────────────────────────────────
// Full configuration for one resp-decode run.
// Populated by parse_config() from CLI arguments.

struct DecodeConfig {
    std::string                input;      // File path, "-" for stdin
    std::optional<std::string> eval;       // Raw message bytes (escapes expanded)
    OutputFormat               format = OutputFormat::Reply;
    std::string                log_level;  // spdlog level string

    protocol::DecoderLimits    limits;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a DecodeConfig.
//
// On success: returns a fully validated DecodeConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - every limit > 0
//   - --format is "reply" or "debug"
//   - --eval is not combined with an explicit --input
//   - --eval escapes are well formed

[[nodiscard]] DecodeConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with resp-decode
// options. Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// ── unescape ──────────────────────────────────────────────────────────────────
// Expand C-style escapes so a message can be typed on the command line:
//   \r \n \t \0 \\ \" and \xNN (exactly two hex digits).
// Throws std::runtime_error on an unknown or truncated escape.

[[nodiscard]] std::string unescape(std::string_view text);

} // namespace resp
