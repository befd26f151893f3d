#include "common/decode_config.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace resp {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Value of one hex digit, or -1.
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] OutputFormat parse_format(const std::string& s) {
    if (s == "reply") return OutputFormat::Reply;
    if (s == "debug") return OutputFormat::Debug;
    throw std::runtime_error(
        fmt::format("--format must be 'reply' or 'debug', got '{}'", s));
}

void require_positive(int64_t value, std::string_view option) {
    if (value <= 0) {
        throw std::runtime_error(fmt::format("{} must be > 0", option));
    }
}

// Validate the fully populated DecodeConfig.
void validate(const DecodeConfig& cfg) {
    require_positive(cfg.limits.max_bulk_length,   "--max-bulk-length");
    require_positive(cfg.limits.max_array_length,  "--max-array-length");

    if (cfg.input.empty()) {
        throw std::runtime_error("--input must not be empty");
    }
}

} // anonymous namespace

// ── unescape ──────────────────────────────────────────────────────────────────

std::string unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }

        if (i + 1 >= text.size()) {
            throw std::runtime_error("Trailing backslash in --eval");
        }

        const char e = text[++i];
        switch (e) {
            case 'r':  out.push_back('\r'); break;
            case 'n':  out.push_back('\n'); break;
            case 't':  out.push_back('\t'); break;
            case '0':  out.push_back('\0'); break;
            case '\\': out.push_back('\\'); break;
            case '"':  out.push_back('"');  break;
            case 'x': {
                if (i + 2 >= text.size()) {
                    throw std::runtime_error("Truncated \\x escape in --eval");
                }
                const int hi = hex_value(text[i + 1]);
                const int lo = hex_value(text[i + 2]);
                if (hi < 0 || lo < 0) {
                    throw std::runtime_error(
                        fmt::format("Invalid \\x escape in --eval: '\\x{}'", text.substr(i + 1, 2)));
                }
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                break;
            }
            default:
                throw std::runtime_error(
                    fmt::format("Unknown escape '\\{}' in --eval", e));
        }
    }
    return out;
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const protocol::DecoderLimits defaults;

    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("input,i",
            po::value<std::string>()->default_value("-"),
            "File holding one RESP message, '-' for stdin")
        ("eval,e",
            po::value<std::string>(),
            "Decode this string instead of reading input (\\r \\n \\t \\0 \\\\ \\\" \\xNN expanded)")
        ("format,f",
            po::value<std::string>()->default_value("reply"),
            "Output format: reply (redis-cli style) or debug")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical")
        ("max-line-length",
            po::value<int64_t>()->default_value(static_cast<int64_t>(defaults.max_line_length)),
            "Longest simple string, error or integer line in bytes")
        ("max-bulk-length",
            po::value<int64_t>()->default_value(defaults.max_bulk_length),
            "Largest accepted bulk string length in bytes")
        ("max-array-length",
            po::value<int64_t>()->default_value(defaults.max_array_length),
            "Largest accepted array element count")
        ("max-depth",
            po::value<int64_t>()->default_value(static_cast<int64_t>(defaults.max_nesting_depth)),
            "Deepest accepted array nesting");
}

// ── parse_config ──────────────────────────────────────────────────────────────

DecodeConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("resp-decode options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    DecodeConfig cfg;
    cfg.input     = vm["input"].as<std::string>();
    cfg.format    = parse_format(vm["format"].as<std::string>());
    cfg.log_level = vm["log-level"].as<std::string>();

    // Size options are read signed so a negative value is rejected rather
    // than wrapped into a huge unsigned limit.
    const auto max_line_length = vm["max-line-length"].as<int64_t>();
    const auto max_depth       = vm["max-depth"].as<int64_t>();
    require_positive(max_line_length, "--max-line-length");
    require_positive(max_depth,       "--max-depth");

    cfg.limits.max_line_length   = static_cast<std::size_t>(max_line_length);
    cfg.limits.max_bulk_length   = vm["max-bulk-length"].as<int64_t>();
    cfg.limits.max_array_length  = vm["max-array-length"].as<int64_t>();
    cfg.limits.max_nesting_depth = static_cast<std::size_t>(max_depth);

    if (vm.count("eval")) {
        if (!vm["input"].defaulted()) {
            throw std::runtime_error("--eval and --input are mutually exclusive");
        }
        cfg.eval = unescape(vm["eval"].as<std::string>());
    }

    validate(cfg);
    return cfg;
}

} // namespace resp
