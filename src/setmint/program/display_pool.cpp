#include <setmint/memory.hpp>
#include <setmint/program/display_pool.hpp>
#include <setmint/program/storage.hpp>

#include <algorithm>

namespace setmint::program {

static constexpr std::span< const std::byte > header_key{};

display_pool::display_pool( system_interface* system, std::uint32_t space_id ) noexcept:
    _system( system ),
    _space_id( space_id )
{}

result< display_pool::header > display_pool::load_header() const
{
  return get_record< header >( _system, _space_id, header_key )
    .transform(
      []( auto&& h )
      {
        return h.value_or( header{} );
      } );
}

display_pool::slot_key display_pool::make_key( const header& h, std::uint64_t index )
{
  slot_key key{};
  std::ranges::copy( memory::to_big_endian( h.generation ), key.begin() );
  std::ranges::copy( memory::to_big_endian( index ), key.begin() + sizeof( std::uint64_t ) );
  return key;
}

result< std::uint64_t > display_pool::size() const
{
  return load_header().transform(
    []( const header& h )
    {
      return h.size;
    } );
}

result< std::uint64_t > display_pool::slot( const header& h, std::uint64_t index ) const
{
  auto object = _system->get_object( _space_id, make_key( h, index ) );
  if( object.empty() )
    return index;

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  return memory::from_little_endian< std::uint64_t >( object );
}

std::error_code display_pool::reset( std::uint64_t size )
{
  auto current = load_header();
  if( !current )
    return current.error();

  // Slots of earlier generations are unreachable from the new header
  return put_record( _system, _space_id, header_key, header{ .generation = current->generation + 1, .size = size } );
}

result< std::uint64_t > display_pool::draw( std::uint64_t random )
{
  auto h = load_header();
  if( !h )
    return std::unexpected( h.error() );

  if( h->size == 0 )
    return std::unexpected( program_errc::pool_exhausted );

  auto index = random % h->size;
  auto last  = h->size - 1;

  auto number = slot( *h, index );
  if( !number )
    return number;

  if( index != last )
  {
    auto moved = slot( *h, last );
    if( !moved )
      return moved;

    if( *moved == index )
    {
      if( auto error = _system->remove_object( _space_id, make_key( *h, index ) ); error )
        return std::unexpected( error );
    }
    else if( auto error = put_integer( _system, _space_id, make_key( *h, index ), *moved ); error )
    {
      return std::unexpected( error );
    }
  }

  if( auto error = _system->remove_object( _space_id, make_key( *h, last ) ); error )
    return std::unexpected( error );

  h->size = last;
  if( auto error = put_record( _system, _space_id, header_key, *h ); error )
    return std::unexpected( error );

  return number;
}

} // namespace setmint::program
