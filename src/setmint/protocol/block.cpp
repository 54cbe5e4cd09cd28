#include <setmint/protocol/block.hpp>

namespace setmint::protocol {

bool block::validate() const noexcept
{
  if( make_id( *this ) != id )
    return false;

  for( const auto& transaction: transactions )
    if( !transaction.validate() )
      return false;

  return true;
}

crypto::digest make_id( const block& b )
{
  crypto::hasher h;

  h.update( b.previous );
  h.update( b.height );
  h.update( b.timestamp );

  for( const auto& transaction: b.transactions )
    h.update( transaction.id );

  return h.finalize();
}

crypto::digest make_entropy( const block& b )
{
  return crypto::hash_all( std::string_view( "entropy" ), b.previous, b.height, b.timestamp );
}

} // namespace setmint::protocol
