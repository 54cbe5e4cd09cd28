#pragma once

#include <span>
#include <string>
#include <system_error>

#include <setmint/program/system_interface.hpp>

namespace setmint::program {

/**
 * A native program hosted by the controller.
 *
 * run reads its instruction from stdin and writes results to stdout. A
 * non-ok code reverts every state change and event of the invocation; text
 * written to stderr becomes part of the revert message.
 */
struct program
{
  program()                 = default;
  program( const program& ) = delete;
  program( program&& )      = delete;
  virtual ~program()        = default;

  program& operator=( const program& ) = delete;
  program& operator=( program&& )      = delete;

  virtual std::error_code run( system_interface* system, std::span< const std::string > arguments ) = 0;
};

} // namespace setmint::program
