#pragma once

#include <expected>
#include <system_error>

namespace setmint::controller {

enum class reversion_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  failure,
  invalid_program,
  invalid_event_name,
  insufficient_balance,
  overflow,
  read_only_context,
  stack_overflow,
  bad_file_descriptor,
  end_of_input
};

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_nonce,
  malformed_block,
  malformed_transaction,
  unknown_previous_block,
  unexpected_height,
  timestamp_out_of_bounds,
  unknown_operation
};

const std::error_category& reversion_category() noexcept;
const std::error_category& controller_category() noexcept;

std::error_code make_error_code( reversion_errc e );
std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace setmint::controller

template<>
struct std::is_error_code_enum< setmint::controller::reversion_errc >: public std::true_type
{};

template<>
struct std::is_error_code_enum< setmint::controller::controller_errc >: public std::true_type
{};
