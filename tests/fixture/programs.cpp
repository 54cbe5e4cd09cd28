// NOLINTBEGIN

#include <test/programs.hpp>

#include <limits>

#include <setmint/program/io.hpp>
#include <setmint/program/token.hpp>

namespace test {

scripted_random_source::scripted_random_source( std::vector< std::uint64_t > v ):
    values( std::move( v ) )
{}

std::uint64_t scripted_random_source::next( setmint::program::system_interface*, std::uint64_t )
{
  if( values.empty() )
    return 0;

  auto value = values[ std::min( position, values.size() - 1 ) ];
  ++position;
  return value;
}

reentrant_token::reentrant_token( const setmint::protocol::account& t, std::vector< std::byte > c ):
    target( t ),
    callback( std::move( c ) )
{}

std::error_code reentrant_token::run( setmint::program::system_interface* system, std::span< const std::string > )
{
  using setmint::program::token;

  auto instr = setmint::program::read_integer< std::uint32_t >( system );
  if( !instr )
    return instr.error();

  switch( static_cast< token::instruction >( *instr ) )
  {
    case token::instruction::balance_of:
      return setmint::program::write_integer( system, std::numeric_limits< std::uint64_t >::max() );
    case token::instruction::transfer_from:
      {
        ++callbacks;
        auto output = system->call_program( target, callback );
        last_error  = output ? std::error_code{} : output.error();
        return setmint::program::write_bool( system, true );
      }
    default:
      return setmint::program::program_errc::invalid_instruction;
  }
}

} // namespace test

// NOLINTEND
