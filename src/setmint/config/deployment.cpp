#include <setmint/config/deployment.hpp>
#include <setmint/encode.hpp>

#include <stdexcept>
#include <string_view>

namespace setmint::config {

using namespace std::string_view_literals;

protocol::account parse_account( const std::string& text )
{
  static constexpr auto user_prefix    = "user:"sv;
  static constexpr auto program_prefix = "program:"sv;

  std::string_view sv( text );

  if( sv.starts_with( user_prefix ) && sv.size() > user_prefix.size() )
    return protocol::user_account( sv.substr( user_prefix.size() ) );

  if( sv.starts_with( program_prefix ) && sv.size() > program_prefix.size() )
    return protocol::program_account( sv.substr( program_prefix.size() ) );

  auto account = protocol::account_from_hex( sv );
  if( !account )
    throw std::invalid_argument( "invalid account '" + text + "': " + account.error().message() );

  return *account;
}

template< typename T >
static T required( const YAML::Node& node, const char* key )
{
  if( !node[ key ] )
    throw std::invalid_argument( std::string( "deployment is missing '" ) + key + "'" );

  return node[ key ].as< T >();
}

template< typename T >
static T optional( const YAML::Node& node, const char* key, T default_value )
{
  if( !node[ key ] )
    return default_value;

  return node[ key ].as< T >();
}

program::deployment_bundle parse_deployment( const YAML::Node& node )
{
  if( !node || !node.IsMap() )
    throw std::invalid_argument( "deployment must be a map" );

  program::deployment_bundle bundle;

  bundle.name              = required< std::string >( node, "name" );
  bundle.symbol            = required< std::string >( node, "symbol" );
  bundle.owner             = parse_account( required< std::string >( node, "owner" ) );
  bundle.coin_fee          = optional< std::uint64_t >( node, "coin-fee", 0 );
  bundle.token_fee         = optional< std::uint64_t >( node, "token-fee", 0 );
  bundle.fee_address       = parse_account( required< std::string >( node, "fee-address" ) );
  bundle.payment_token     = parse_account( required< std::string >( node, "payment-token" ) );
  bundle.base_uri          = required< std::string >( node, "base-uri" );
  bundle.contract_uri      = optional< std::string >( node, "contract-uri", "" );
  bundle.max_supply        = required< std::uint64_t >( node, "max-supply" );
  bundle.royalty_numerator = optional< std::uint64_t >( node, "royalty-numerator", 0 );

  if( bundle.royalty_numerator > program::royalty_denominator )
    throw std::invalid_argument( "royalty-numerator must not exceed "
                                 + std::to_string( program::royalty_denominator ) );

  return bundle;
}

} // namespace setmint::config
