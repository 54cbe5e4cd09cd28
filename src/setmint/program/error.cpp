#include <setmint/program/error.hpp>
#include <string>
#include <utility>

namespace setmint::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::unauthorized:
        return "unauthorized"s;
      case program_errc::invalid_instruction:
        return "invalid instruction"s;
      case program_errc::invalid_argument:
        return "invalid argument"s;
      case program_errc::insufficient_balance:
        return "insufficient balance"s;
      case program_errc::insufficient_allowance:
        return "insufficient allowance"s;
      case program_errc::insufficient_supply:
        return "insufficient supply"s;
      case program_errc::unexpected_object:
        return "unexpected object"s;
      case program_errc::overflow:
        return "overflow"s;
      case program_errc::zero_address:
        return "zero address"s;
      case program_errc::supply_already_issued:
        return "supply already issued"s;
      case program_errc::already_initialized:
        return "already initialized"s;
      case program_errc::not_initialized:
        return "not initialized"s;
      case program_errc::contract_paused:
        return "contract paused"s;
      case program_errc::insufficient_mint_quantity:
        return "insufficient mint quantity"s;
      case program_errc::exceeds_batch_limit:
        return "exceeds batch limit"s;
      case program_errc::exceeds_max_supply:
        return "exceeds max supply"s;
      case program_errc::batch_limit_too_high:
        return "batch limit too high"s;
      case program_errc::set_already_active:
        return "set already active"s;
      case program_errc::set_not_configured:
        return "set not configured"s;
      case program_errc::insufficient_token_balance:
        return "insufficient token balance"s;
      case program_errc::token_transfer_failed:
        return "token transfer failed"s;
      case program_errc::insufficient_coin_fee:
        return "insufficient coin fee"s;
      case program_errc::coin_transfer_failed:
        return "coin transfer failed"s;
      case program_errc::royalty_too_high:
        return "royalty too high"s;
      case program_errc::nonexistent_token:
        return "nonexistent token"s;
      case program_errc::reentrant_call:
        return "reentrant call"s;
      case program_errc::pool_exhausted:
        return "pool exhausted"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace setmint::program
