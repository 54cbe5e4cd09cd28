#include <setmint/program/storage.hpp>

namespace setmint::program {

result< std::uint64_t > get_integer( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( object.empty() )
    return 0;

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  return memory::from_little_endian< std::uint64_t >( object );
}

std::error_code
put_integer( system_interface* system, std::uint32_t id, std::span< const std::byte > key, std::uint64_t value )
{
  return system->put_object( id, key, memory::to_little_endian( value ) );
}

} // namespace setmint::program
