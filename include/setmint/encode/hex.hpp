#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <setmint/encode/error.hpp>

namespace setmint::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

/**
 * Decodes a hex string into a fixed size array, failing unless the
 * decoded length matches exactly.
 */
template< std::size_t N >
result< std::array< std::byte, N > > from_hex_fixed( std::string_view sv ) noexcept
{
  return from_hex( sv ).and_then(
    []( auto&& bytes ) -> result< std::array< std::byte, N > >
    {
      if( bytes.size() != N )
        return std::unexpected( encode_errc::invalid_length );

      std::array< std::byte, N > out{};
      std::copy( bytes.begin(), bytes.end(), out.begin() );
      return out;
    } );
}

} // namespace setmint::encode
