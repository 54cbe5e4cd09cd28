#include <setmint/protocol/transaction.hpp>

#include <cstddef>
#include <variant>
#include <vector>

namespace setmint::protocol {

std::size_t transaction::size() const noexcept
{
  std::size_t bytes = 0;

  bytes += id.size();
  bytes += signer.size();
  bytes += sizeof( nonce );

  for( const auto& operation: operations )
    bytes += std::visit(
      []( const auto& op )
      {
        return op.size();
      },
      operation );

  return bytes;
}

bool transaction::validate() const noexcept
{
  if( !signer.user() )
    return false;

  if( operations.empty() )
    return false;

  if( make_id( *this ) != id )
    return false;

  for( const auto& operation: operations )
  {
    bool valid = std::visit(
      []( const auto& op )
      {
        return op.validate();
      },
      operation );

    if( !valid )
      return false;
  }

  return true;
}

crypto::digest make_id( const transaction& t )
{
  crypto::hasher h;

  h.update( t.signer );
  h.update( t.nonce );

  for( const auto& operation: t.operations )
  {
    if( std::holds_alternative< call_program >( operation ) )
    {
      const auto& call = std::get< call_program >( operation );
      h.update( std::uint8_t( 0 ) );
      h.update( call.id );
      h.update( call.value );
      h.update( std::uint64_t( call.input.arguments.size() ) );
      for( const auto& argument: call.input.arguments )
        h.update( std::uint64_t( argument.size() ) ).update( std::string_view( argument ) );
      h.update( std::uint64_t( call.input.stdin.size() ) );
      h.update( std::span( call.input.stdin ) );
    }
    else if( std::holds_alternative< transfer >( operation ) )
    {
      const auto& xfer = std::get< transfer >( operation );
      h.update( std::uint8_t( 1 ) );
      h.update( xfer.to );
      h.update( xfer.value );
    }
  }

  return h.finalize();
}

} // namespace setmint::protocol
