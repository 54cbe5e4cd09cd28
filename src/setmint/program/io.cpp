#include <setmint/program/io.hpp>

namespace setmint::program {

result< bool > read_bool( system_interface* system )
{
  return read_integer< std::uint8_t >( system ).and_then(
    []( std::uint8_t b ) -> result< bool >
    {
      if( b > 1 )
        return std::unexpected( program_errc::invalid_argument );

      return b == 1;
    } );
}

result< protocol::account > read_account( system_interface* system )
{
  protocol::account account{};

  if( system->read( file_descriptor::stdin, account ) )
    return std::unexpected( program_errc::invalid_argument );

  return account;
}

result< std::string > read_string( system_interface* system )
{
  auto length = read_integer< std::uint32_t >( system );
  if( !length )
    return std::unexpected( length.error() );

  if( *length > max_string_length )
    return std::unexpected( program_errc::invalid_argument );

  std::string str( *length, '\0' );

  if( system->read( file_descriptor::stdin, std::as_writable_bytes( std::span( str ) ) ) )
    return std::unexpected( program_errc::invalid_argument );

  return str;
}

std::error_code write_bool( system_interface* system, bool b )
{
  return write_integer( system, static_cast< std::uint8_t >( b ? 1 : 0 ) );
}

std::error_code write_account( system_interface* system, const protocol::account& account )
{
  return system->write( file_descriptor::stdout, account );
}

std::error_code write_string( system_interface* system, std::string_view sv )
{
  return system->write( file_descriptor::stdout, memory::as_bytes( sv ) );
}

std::error_code write_error( system_interface* system, std::string_view sv )
{
  return system->write( file_descriptor::stderr, memory::as_bytes( sv ) );
}

result< bool > decode_bool( std::span< const std::byte > bytes )
{
  return decode_integer< std::uint8_t >( bytes ).and_then(
    []( std::uint8_t b ) -> result< bool >
    {
      if( b > 1 )
        return std::unexpected( program_errc::unexpected_object );

      return b == 1;
    } );
}

} // namespace setmint::program
