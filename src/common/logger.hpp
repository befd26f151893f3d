#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace resp {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("resp") used by the decoder and the
// command-line tools. Idempotent: a second call only updates the level.
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace resp
