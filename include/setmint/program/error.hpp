#pragma once

#include <expected>
#include <system_error>

namespace setmint::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  unauthorized,
  invalid_instruction,
  invalid_argument,
  insufficient_balance,
  insufficient_allowance,
  insufficient_supply,
  unexpected_object,
  overflow,
  zero_address,
  supply_already_issued,

  already_initialized,
  not_initialized,
  contract_paused,
  insufficient_mint_quantity,
  exceeds_batch_limit,
  exceeds_max_supply,
  batch_limit_too_high,
  set_already_active,
  set_not_configured,
  insufficient_token_balance,
  token_transfer_failed,
  insufficient_coin_fee,
  coin_transfer_failed,
  royalty_too_high,
  nonexistent_token,
  reentrant_call,
  pool_exhausted
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace setmint::program

template<>
struct std::is_error_code_enum< setmint::program::program_errc >: public std::true_type
{};
