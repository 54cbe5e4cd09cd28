#include <setmint/config/deployment.hpp>
#include <setmint/config/scenario.hpp>

#include <map>
#include <stdexcept>

namespace setmint::config {

action_type parse_action_type( const std::string& name )
{
  static const std::map< std::string, action_type > types{
    { "approve",         action_type::approve         },
    { "mint",            action_type::mint            },
    { "pause",           action_type::pause           },
    { "start-set",       action_type::start_set       },
    { "set-base-uri",    action_type::set_base_uri    },
    { "set-coin-fee",    action_type::set_coin_fee    },
    { "set-token-fee",   action_type::set_token_fee   },
    { "set-batch-limit", action_type::set_batch_limit },
    { "withdraw-coin",   action_type::withdraw_coin   },
    { "withdraw-tokens", action_type::withdraw_tokens },
    { "transfer",        action_type::transfer        },
    { "burn",            action_type::burn            }
  };

  if( auto itr = types.find( name ); itr != types.end() )
    return itr->second;

  throw std::invalid_argument( "unknown action '" + name + "'" );
}

template< typename T >
static T field( const YAML::Node& node, const char* key, const std::string& context )
{
  if( !node[ key ] )
    throw std::invalid_argument( context + " is missing '" + key + "'" );

  return node[ key ].as< T >();
}

static action parse_action( const YAML::Node& node )
{
  if( !node.IsMap() )
    throw std::invalid_argument( "script entries must be maps" );

  auto name = field< std::string >( node, "action", "script entry" );

  action a;
  a.type   = parse_action_type( name );
  a.signer = parse_account( field< std::string >( node, "signer", name ) );

  switch( a.type )
  {
    case action_type::approve:
      a.amount = field< std::uint64_t >( node, "amount", name );
      break;
    case action_type::mint:
      a.amount = field< std::uint64_t >( node, "quantity", name );
      a.value  = node[ "value" ] ? node[ "value" ].as< std::uint64_t >() : 0;
      break;
    case action_type::pause:
      a.flag = field< bool >( node, "paused", name );
      break;
    case action_type::start_set:
      a.set = field< std::uint64_t >( node, "set", name );
      break;
    case action_type::set_base_uri:
      a.set        = field< std::uint64_t >( node, "set", name );
      a.max_supply = field< std::uint64_t >( node, "max-supply", name );
      a.counter    = node[ "counter" ] ? node[ "counter" ].as< std::uint64_t >() : 0;
      a.uri        = field< std::string >( node, "uri", name );
      break;
    case action_type::set_coin_fee:
    case action_type::set_token_fee:
      a.amount = field< std::uint64_t >( node, "fee", name );
      break;
    case action_type::set_batch_limit:
      a.amount = field< std::uint64_t >( node, "limit", name );
      break;
    case action_type::withdraw_coin:
    case action_type::withdraw_tokens:
      a.target = parse_account( field< std::string >( node, "receiver", name ) );
      break;
    case action_type::transfer:
      a.target   = parse_account( field< std::string >( node, "to", name ) );
      a.token_id = field< std::uint64_t >( node, "token", name );
      break;
    case action_type::burn:
      a.token_id = field< std::uint64_t >( node, "token", name );
      break;
  }

  return a;
}

scenario parse_scenario( const YAML::Node& root )
{
  if( !root || !root.IsMap() )
    throw std::invalid_argument( "scenario must be a map" );

  scenario s;
  s.deployment = parse_deployment( root[ "deployment" ] );
  s.minter     = parse_account( root[ "minter" ] ? root[ "minter" ].as< std::string >() : "program:setmint" );

  if( !s.minter.program() )
    throw std::invalid_argument( "minter must be a program account" );

  if( !s.deployment.payment_token.program() )
    throw std::invalid_argument( "payment-token must be a program account" );

  if( const auto& token = root[ "payment-token" ]; token )
  {
    s.payment_token.name     = field< std::string >( token, "name", "payment-token" );
    s.payment_token.symbol   = field< std::string >( token, "symbol", "payment-token" );
    s.payment_token.decimals = token[ "decimals" ] ? token[ "decimals" ].as< std::uint32_t >() : 8;
    s.payment_token.supply   = token[ "supply" ] ? token[ "supply" ].as< std::uint64_t >() : 0;

    if( s.payment_token.supply )
      s.payment_token.holder = parse_account( field< std::string >( token, "holder", "payment-token" ) );
  }
  else
  {
    s.payment_token.name   = "Payment Token";
    s.payment_token.symbol = "PAY";
  }

  for( const auto& entry: root[ "genesis" ] )
    s.genesis.push_back( allocation{ .account = parse_account( field< std::string >( entry, "account", "genesis" ) ),
                                     .balance = field< std::uint64_t >( entry, "balance", "genesis" ) } );

  for( const auto& entry: root[ "script" ] )
    s.script.push_back( parse_action( entry ) );

  return s;
}

} // namespace setmint::config
