#include <setmint/state_db/backends/map/map_backend.hpp>
#include <setmint/state_db/state_delta.hpp>

#include <system_error>

namespace setmint::state_db {

state_delta::state_delta() noexcept:
    _backend( std::make_shared< backends::map::map_backend >() )
{}

state_delta::state_delta( const std::shared_ptr< state_delta >& parent ) noexcept:
    _parent( parent ),
    _backend( std::make_shared< backends::map::map_backend >() ),
    _id( parent->id() ),
    _revision( parent->revision() )
{}

void state_delta::check_writable() const
{
  if( _squashed )
    throw std::system_error( state_db_errc::already_squashed );
}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  check_writable();

  std::int64_t size = 0;

  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _backend->remove( key );

  if( !root() )
    _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto value = node->_backend->get( key ); value )
      return value;
  }

  return {};
}

void state_delta::squash()
{
  check_writable();

  if( root() )
    throw std::system_error( state_db_errc::root_squash );

  auto& parent = *_parent;
  parent.check_writable();

  // A removal here hides the object in the parent. Below the root the
  // tombstone has to move up as well, since the grandparent may still hold it.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    parent._backend->remove( *itr );

    if( !parent.root() )
      parent._removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  while( auto object = _backend->extract_front() )
  {
    if( !parent.root() )
      parent._removed_objects.erase( object->first );

    parent._backend->put( std::move( object->first ), std::move( object->second ) );
  }

  _squashed = true;
}

void state_delta::clear()
{
  _backend->clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

bool state_delta::squashed() const
{
  return _squashed;
}

std::uint64_t state_delta::revision() const
{
  return _revision;
}

void state_delta::set_revision( std::uint64_t revision )
{
  _revision = revision;
}

const state_node_id& state_delta::id() const
{
  return _id;
}

void state_delta::set_id( const state_node_id& id )
{
  _id = id;
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  check_writable();
  return std::make_shared< state_delta >( shared_from_this() );
}

} // namespace setmint::state_db
