#include <setmint/state_db/backends/map/map_backend.hpp>

namespace setmint::state_db::backends::map {

void map_backend::put( key_type&& key, value_type&& value )
{
  _objects.insert_or_assign( std::move( key ), std::move( value ) );
}

std::optional< std::span< const std::byte > > map_backend::get( const key_type& key ) const
{
  auto itr = _objects.find( key );
  if( itr == _objects.end() )
    return std::nullopt;

  return itr->second;
}

void map_backend::remove( const key_type& key )
{
  _objects.erase( key );
}

void map_backend::clear()
{
  _objects.clear();
}

std::optional< std::pair< key_type, value_type > > map_backend::extract_front()
{
  if( _objects.empty() )
    return std::nullopt;

  auto node = _objects.extract( _objects.begin() );
  return std::pair( std::move( node.key() ), std::move( node.mapped() ) );
}

} // namespace setmint::state_db::backends::map
