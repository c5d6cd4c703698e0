/// @file logging.hpp
/// @brief The library logger.
///
/// All diagnostics go through one spdlog logger named `json_crdt`,
/// writing to stderr at level `warn` unless configured otherwise.
/// Register a logger under that name before first use to redirect it.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace json_crdt_cpp {

/// The `json_crdt` logger, created on first use.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Set the level of the `json_crdt` logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace json_crdt_cpp
