#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <boost/archive/archive_exception.hpp>

#include <setmint/memory.hpp>
#include <setmint/program/system_interface.hpp>
#include <setmint/protocol/serialization.hpp>

namespace setmint::program {

/**
 * Reads a binary serialized record. An absent object yields an empty
 * optional, a malformed one is unexpected_object.
 */
template< typename T >
result< std::optional< T > > get_record( system_interface* system, std::uint32_t id, std::span< const std::byte > key )
{
  auto object = system->get_object( id, key );
  if( object.empty() )
    return std::optional< T >{};

  try
  {
    return std::optional< T >( protocol::from_binary< T >( object ) );
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::unexpected( program_errc::unexpected_object );
  }
}

template< typename T >
std::error_code put_record( system_interface* system, std::uint32_t id, std::span< const std::byte > key, const T& t )
{
  return system->put_object( id, key, protocol::to_binary( t ) );
}

/**
 * Reads a little-endian u64, treating an absent object as zero.
 */
result< std::uint64_t > get_integer( system_interface* system, std::uint32_t id, std::span< const std::byte > key );
std::error_code put_integer( system_interface* system, std::uint32_t id, std::span< const std::byte > key, std::uint64_t value );

} // namespace setmint::program
