#include <setmint/memory.hpp>
#include <setmint/state_db/state_node.hpp>

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace setmint::state_db {

static std::vector< std::byte > object_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > result;
  result.reserve( sizeof( space ) + key.size() );
  std::ranges::copy( memory::as_bytes( space ), std::back_inserter( result ) );
  std::ranges::copy( key, std::back_inserter( result ) );
  return result;
}

state_node::state_node( std::shared_ptr< state_delta > delta ) noexcept:
    _delta( std::move( delta ) )
{}

state_delta& state_node::current() const
{
  if( !_delta )
    throw std::system_error( state_db_errc::already_squashed );

  return *_delta;
}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return current().get( object_key( space, key ) );
}

std::int64_t
state_node::put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value )
{
  return current().put( object_key( space, key ), value );
}

std::int64_t state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  return current().remove( object_key( space, key ) );
}

temporary_state_node_ptr state_node::make_child()
{
  return std::make_shared< temporary_state_node >( current().make_child() );
}

const state_node_id& state_node::id() const
{
  return current().id();
}

std::uint64_t state_node::revision() const
{
  return current().revision();
}

permanent_state_node::permanent_state_node( std::shared_ptr< state_delta > delta ) noexcept:
    state_node( std::move( delta ) )
{}

void permanent_state_node::commit( temporary_state_node& child, const state_node_id& id, std::uint64_t revision )
{
  if( !child._delta || child._delta->parent() != _delta )
    throw std::system_error( state_db_errc::not_a_child );

  child.squash();
  current().set_id( id );
  current().set_revision( revision );
}

temporary_state_node::temporary_state_node( std::shared_ptr< state_delta > delta ) noexcept:
    state_node( std::move( delta ) )
{}

void temporary_state_node::squash()
{
  current().squash();
  _delta.reset();
}

} // namespace setmint::state_db
