#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <boost/serialization/array_wrapper.hpp>

#include <setmint/encode/error.hpp>
#include <setmint/protocol/serialization.hpp>

namespace setmint::protocol {

constexpr std::size_t account_length = 20;

enum class account_type : std::uint8_t
{
  null,
  user,
  program,
  invalid
};

/**
 * A 20 byte address. The first byte identifies the account type, the
 * remaining bytes are taken from a BLAKE3 digest of the account seed. The
 * all-zero account is the null account.
 */
struct account: std::array< std::byte, account_length >
{
  bool null() const noexcept;
  bool user() const noexcept;
  bool program() const noexcept;
  account_type type() const noexcept;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & boost::serialization::make_array( data(), size() );
  }
};

account user_account( std::string_view seed ) noexcept;
account program_account( std::string_view name ) noexcept;

encode::result< account > account_from_hex( std::string_view hex ) noexcept;

} // namespace setmint::protocol
