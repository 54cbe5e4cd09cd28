#pragma once

#include <cstdint>

#include <setmint/program/system_interface.hpp>

namespace setmint::program {

/**
 * Supplies the random value used to pick a display number for a token.
 */
struct random_source
{
  random_source()                       = default;
  random_source( const random_source& ) = delete;
  random_source( random_source&& )      = delete;
  virtual ~random_source()              = default;

  random_source& operator=( const random_source& ) = delete;
  random_source& operator=( random_source&& )      = delete;

  virtual std::uint64_t next( system_interface* system, std::uint64_t token_id ) = 0;
};

/**
 * Derives randomness from the host entropy, the caller and the token id.
 *
 * Block producers can bias the result. Not suitable where a single draw
 * carries significant value.
 */
struct chain_random_source final: public random_source
{
  std::uint64_t next( system_interface* system, std::uint64_t token_id ) override;
};

} // namespace setmint::program
