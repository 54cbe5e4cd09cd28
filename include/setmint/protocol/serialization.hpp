#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/is_bitwise_serializable.hpp>

BOOST_IS_BITWISE_SERIALIZABLE( std::byte )

namespace setmint::protocol {

constexpr unsigned int archive_flags = boost::archive::no_header | boost::archive::no_tracking;

/**
 * Serializes a boost serializable value into a headerless binary archive.
 */
template< typename T >
std::vector< std::byte > to_binary( const T& t )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, archive_flags );
    oa << t;
  }

  auto view = ss.view();
  std::vector< std::byte > bytes( view.size() );
  std::memcpy( bytes.data(), view.data(), view.size() );
  return bytes;
}

/**
 * Deserializes a value written by to_binary.
 *
 * Throws boost::archive::archive_exception when the bytes are truncated.
 */
template< typename T >
T from_binary( std::span< const std::byte > bytes )
{
  std::stringstream ss( std::string( reinterpret_cast< const char* >( bytes.data() ), bytes.size() ) ); // NOLINT
  boost::archive::binary_iarchive ia( ss, archive_flags );

  T t{};
  ia >> t;
  return t;
}

} // namespace setmint::protocol
