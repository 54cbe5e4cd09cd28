#include <setmint/program/io.hpp>
#include <setmint/program/storage.hpp>
#include <setmint/program/token.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace setmint::program {

static constexpr std::uint32_t supply_id    = 0;
static constexpr std::uint32_t balance_id   = 1;
static constexpr std::uint32_t allowance_id = 2;
static constexpr std::uint32_t issued_id    = 3;

static std::array< std::byte, 2 * protocol::account_length > allowance_key( const protocol::account& owner,
                                                                            const protocol::account& spender )
{
  std::array< std::byte, 2 * protocol::account_length > key{};
  std::ranges::copy( owner, key.begin() );
  std::ranges::copy( spender, key.begin() + protocol::account_length );
  return key;
}

token::token( const protocol::account& deployer, std::string name, std::string symbol, std::uint32_t decimals ):
    _deployer( deployer ),
    _name( std::move( name ) ),
    _symbol( std::move( symbol ) ),
    _decimals( decimals )
{}

result< std::uint64_t > token::total_supply( system_interface* system )
{
  return get_integer( system, supply_id, std::span< const std::byte >{} );
}

result< std::uint64_t > token::balance_of( system_interface* system, const protocol::account& account )
{
  return get_integer( system, balance_id, account );
}

result< std::uint64_t >
token::allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender )
{
  return get_integer( system, allowance_id, allowance_key( owner, spender ) );
}

result< bool >
token::move( system_interface* system, const protocol::account& from, const protocol::account& to, std::uint64_t value )
{
  auto from_balance = balance_of( system, from );
  if( !from_balance )
    return std::unexpected( from_balance.error() );

  if( *from_balance < value )
    return false;

  if( from == to )
    return true;

  auto to_balance = balance_of( system, to );
  if( !to_balance )
    return std::unexpected( to_balance.error() );

  if( std::numeric_limits< std::uint64_t >::max() - value < *to_balance )
    return std::unexpected( program_errc::overflow );

  if( auto error = put_integer( system, balance_id, from, *from_balance - value ); error )
    return std::unexpected( error );

  if( auto error = put_integer( system, balance_id, to, *to_balance + value ); error )
    return std::unexpected( error );

  if( auto error = system->event( "token.transfer",
                                  protocol::to_binary( transfer_event{ .from = from, .to = to, .value = value } ),
                                  { from, to } );
      error )
    return std::unexpected( error );

  return true;
}

std::error_code token::run( system_interface* system, std::span< const std::string > arguments )
{
  auto instr = read_integer< std::uint32_t >( system );
  if( !instr )
    return instr.error();

  switch( *instr )
  {
    case std::to_underlying( instruction::name ):
      return write_string( system, _name );
    case std::to_underlying( instruction::symbol ):
      return write_string( system, _symbol );
    case std::to_underlying( instruction::decimals ):
      return write_integer( system, _decimals );
    case std::to_underlying( instruction::total_supply ):
      {
        auto supply = total_supply( system );
        if( !supply )
          return supply.error();

        return write_integer( system, *supply );
      }
    case std::to_underlying( instruction::balance_of ):
      {
        auto account = read_account( system );
        if( !account )
          return account.error();

        auto balance = balance_of( system, *account );
        if( !balance )
          return balance.error();

        return write_integer( system, *balance );
      }
    case std::to_underlying( instruction::transfer ):
      {
        auto to    = read_account( system );
        auto value = to.and_then(
          [ & ]( auto&& )
          {
            return read_integer< std::uint64_t >( system );
          } );

        if( !value )
          return value.error();

        if( to->null() )
          return program_errc::zero_address;

        auto success = move( system, system->get_caller(), *to, *value );
        if( !success )
          return success.error();

        return write_bool( system, *success );
      }
    case std::to_underlying( instruction::approve ):
      {
        auto spender = read_account( system );
        auto value   = spender.and_then(
          [ & ]( auto&& )
          {
            return read_integer< std::uint64_t >( system );
          } );

        if( !value )
          return value.error();

        if( spender->null() )
          return program_errc::zero_address;

        const auto& owner = system->get_caller();

        if( auto error = put_integer( system, allowance_id, allowance_key( owner, *spender ), *value ); error )
          return error;

        if( auto error = system->event( "token.approval",
                                        protocol::to_binary(
                                          approval_event{ .owner = owner, .spender = *spender, .value = *value } ),
                                        { owner, *spender } );
            error )
          return error;

        return write_bool( system, true );
      }
    case std::to_underlying( instruction::allowance ):
      {
        auto owner   = read_account( system );
        auto spender = owner.and_then(
          [ & ]( auto&& )
          {
            return read_account( system );
          } );

        if( !spender )
          return spender.error();

        auto remaining = allowance( system, *owner, *spender );
        if( !remaining )
          return remaining.error();

        return write_integer( system, *remaining );
      }
    case std::to_underlying( instruction::transfer_from ):
      {
        auto from  = read_account( system );
        auto to    = from.and_then(
          [ & ]( auto&& )
          {
            return read_account( system );
          } );
        auto value = to.and_then(
          [ & ]( auto&& )
          {
            return read_integer< std::uint64_t >( system );
          } );

        if( !value )
          return value.error();

        if( to->null() )
          return program_errc::zero_address;

        const auto& spender = system->get_caller();

        auto remaining = allowance( system, *from, spender );
        if( !remaining )
          return remaining.error();

        if( *remaining < *value )
          return write_bool( system, false );

        auto success = move( system, *from, *to, *value );
        if( !success )
          return success.error();

        if( *success )
          if( auto error = put_integer( system, allowance_id, allowance_key( *from, spender ), *remaining - *value );
              error )
            return error;

        return write_bool( system, *success );
      }
    case std::to_underlying( instruction::mint ):
      {
        auto to    = read_account( system );
        auto value = to.and_then(
          [ & ]( auto&& )
          {
            return read_integer< std::uint64_t >( system );
          } );

        if( !value )
          return value.error();

        if( system->get_caller() != _deployer )
          return program_errc::unauthorized;

        if( to->null() )
          return program_errc::zero_address;

        auto issued = get_record< bool >( system, issued_id, std::span< const std::byte >{} );
        if( !issued )
          return issued.error();

        if( issued->has_value() )
          return program_errc::supply_already_issued;

        if( auto error = put_record( system, issued_id, std::span< const std::byte >{}, true ); error )
          return error;

        if( auto error = put_integer( system, supply_id, std::span< const std::byte >{}, *value ); error )
          return error;

        if( auto error = put_integer( system, balance_id, *to, *value ); error )
          return error;

        return system->event( "token.transfer",
                              protocol::to_binary( transfer_event{ .to = *to, .value = *value } ),
                              { *to } );
      }
    default:
      return program_errc::invalid_instruction;
  }

  return program_errc::ok;
}

} // namespace setmint::program
