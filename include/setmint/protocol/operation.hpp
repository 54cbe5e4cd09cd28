#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

#include <setmint/protocol/account.hpp>
#include <setmint/protocol/program.hpp>

namespace setmint::protocol {

/**
 * Invokes a program. The attached value moves from the transaction signer
 * to the program before it runs.
 */
struct call_program
{
  account id{};
  std::uint64_t value = 0;
  program_input input;

  std::size_t size() const noexcept;
  bool validate() const noexcept;
};

/**
 * Moves native coin from the transaction signer to another account.
 */
struct transfer
{
  account to{};
  std::uint64_t value = 0;

  std::size_t size() const noexcept;
  bool validate() const noexcept;
};

using operation = std::variant< call_program, transfer >;

} // namespace setmint::protocol

template< typename T >
concept Operation = std::same_as< setmint::protocol::operation, T >;
