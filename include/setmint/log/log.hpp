#pragma once

#include <string>

#include <quill/LogMacros.h>

#include <setmint/log/formatter.hpp>
#include <setmint/log/frontend.hpp>

namespace setmint::log {

/**
 * Starts the logging backend and applies the log level.
 *
 * Accepted levels are those understood by quill ("trace_l3" .. "critical"),
 * plus "trace" and "warning" as aliases. Throws std::invalid_argument on an
 * unknown level.
 */
void initialize( const std::string& level = "info" );
logger* instance() noexcept;

} // namespace setmint::log
