#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <setmint/memory.hpp>
#include <setmint/program/system_interface.hpp>

namespace setmint::program {

constexpr std::uint32_t max_string_length = 65'536;

/*
 * Program input is a little-endian u32 instruction followed by its
 * arguments. Integers are little-endian, accounts are raw bytes and strings
 * carry a little-endian u32 length prefix.
 */

template< std::integral T >
result< T > read_integer( system_interface* system )
{
  std::array< std::byte, sizeof( T ) > bytes{};

  if( system->read( file_descriptor::stdin, bytes ) )
    return std::unexpected( program_errc::invalid_argument );

  return memory::from_little_endian< T >( bytes );
}

result< bool > read_bool( system_interface* system );
result< protocol::account > read_account( system_interface* system );
result< std::string > read_string( system_interface* system );

template< std::integral T >
std::error_code write_integer( system_interface* system, T t )
{
  return system->write( file_descriptor::stdout, memory::to_little_endian( t ) );
}

std::error_code write_bool( system_interface* system, bool b );
std::error_code write_account( system_interface* system, const protocol::account& account );

/**
 * Writes a string result without a length prefix.
 */
std::error_code write_string( system_interface* system, std::string_view sv );

/**
 * Appends a diagnostic to the frame's stderr.
 */
std::error_code write_error( system_interface* system, std::string_view sv );

/**
 * Decodes an integer returned by another program.
 */
template< std::integral T >
result< T > decode_integer( std::span< const std::byte > bytes )
{
  if( bytes.size() != sizeof( T ) )
    return std::unexpected( program_errc::unexpected_object );

  return memory::from_little_endian< T >( bytes );
}

result< bool > decode_bool( std::span< const std::byte > bytes );

namespace detail {

template< typename T >
void append_argument( std::vector< std::byte >& buffer, const T& t )
{
  if constexpr( std::is_enum_v< T > )
  {
    append_argument( buffer, static_cast< std::uint32_t >( std::to_underlying( t ) ) );
  }
  else if constexpr( std::is_same_v< T, bool > )
  {
    append_argument( buffer, static_cast< std::uint8_t >( t ? 1 : 0 ) );
  }
  else if constexpr( std::is_integral_v< T > )
  {
    std::ranges::copy( memory::to_little_endian( t ), std::back_inserter( buffer ) );
  }
  else if constexpr( std::is_same_v< T, protocol::account > )
  {
    std::ranges::copy( t, std::back_inserter( buffer ) );
  }
  else
  {
    static_assert( std::is_convertible_v< const T&, std::string_view >, "unsupported program argument" );

    std::string_view sv( t );
    append_argument( buffer, static_cast< std::uint32_t >( sv.size() ) );
    std::ranges::copy( memory::as_bytes( sv ), std::back_inserter( buffer ) );
  }
}

} // namespace detail

/**
 * Encodes an instruction and its arguments as program input.
 */
template< typename... Args >
std::vector< std::byte > make_stdin( const Args&... args )
{
  std::vector< std::byte > buffer;
  ( detail::append_argument( buffer, args ), ... );
  return buffer;
}

} // namespace setmint::program
