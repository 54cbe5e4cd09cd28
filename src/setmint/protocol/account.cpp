#include <setmint/protocol/account.hpp>

#include <algorithm>
#include <utility>

#include <setmint/crypto.hpp>
#include <setmint/encode.hpp>

namespace setmint::protocol {

constexpr auto user_account_prefix    = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix = std::byte{ std::to_underlying( account_type::program ) };

static account derive_account( std::byte prefix, std::string_view seed ) noexcept
{
  auto digest = crypto::hash( seed );

  account a{};
  a.front() = prefix;
  std::copy_n( digest.begin(), a.size() - 1, a.begin() + 1 );
  return a;
}

bool account::null() const noexcept
{
  return std::ranges::all_of( *this,
                              []( std::byte b )
                              {
                                return b == std::byte{ 0x00 };
                              } );
}

bool account::user() const noexcept
{
  return front() == user_account_prefix;
}

bool account::program() const noexcept
{
  return front() == program_account_prefix;
}

account_type account::type() const noexcept
{
  if( null() )
    return account_type::null;

  switch( std::to_integer< std::uint8_t >( front() ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    default:
      return account_type::invalid;
  }
}

account user_account( std::string_view seed ) noexcept
{
  return derive_account( user_account_prefix, seed );
}

account program_account( std::string_view name ) noexcept
{
  return derive_account( program_account_prefix, name );
}

encode::result< account > account_from_hex( std::string_view hex ) noexcept
{
  return encode::from_hex_fixed< account_length >( hex ).transform(
    []( auto&& bytes )
    {
      account a{};
      std::ranges::copy( bytes, a.begin() );
      return a;
    } );
}

} // namespace setmint::protocol
