#pragma once

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace setmint::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

/**
 * Incremental BLAKE3 hasher.
 *
 * Integers are always fed in little-endian byte order so digests are
 * identical across platforms.
 */
class hasher final
{
public:
  hasher();
  hasher( const hasher& ) = delete;
  hasher( hasher&& ) noexcept;
  ~hasher();

  hasher& operator=( const hasher& ) = delete;
  hasher& operator=( hasher&& ) noexcept;

  hasher& update( const void* ptr, std::size_t len );
  hasher& update( std::string_view sv );

  template< std::integral T >
  hasher& update( T t )
  {
    if constexpr( std::endian::native != std::endian::little )
      t = std::byteswap( t );

    return update( &t, sizeof( T ) );
  }

  template< typename T, std::size_t N >
    requires( std::is_trivially_copyable_v< T > )
  hasher& update( const std::array< T, N >& a )
  {
    return update( a.data(), sizeof( T ) * N );
  }

  template< typename T >
  hasher& update( std::span< T > s )
  {
    return update( s.data(), s.size_bytes() );
  }

  template< std::ranges::range Range >
    requires( !std::is_convertible_v< const Range&, std::string_view > )
  hasher& update( const Range& values )
  {
    for( const auto& value: values )
      update( value );

    return *this;
  }

  hasher& update( std::byte b )
  {
    return update( &b, sizeof( b ) );
  }

  digest finalize() const;

private:
  struct impl;
  std::unique_ptr< impl > _impl;
};

digest hash( const void* ptr, std::size_t len );
digest hash( std::string_view sv );

template< typename... Args >
digest hash_all( const Args&... args )
{
  hasher h;
  ( h.update( args ), ... );
  return h.finalize();
}

} // namespace setmint::crypto
