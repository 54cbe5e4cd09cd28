// NOLINTBEGIN

#include <gtest/gtest.h>

#include <stdexcept>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

#include <setmint/config/deployment.hpp>
#include <setmint/config/options.hpp>
#include <setmint/config/scenario.hpp>
#include <setmint/encode.hpp>

using namespace setmint;

constexpr auto deployment_yaml = R"(
name: Genesis Collection
symbol: GEN
owner: user:alice
coin-fee: 100
token-fee: 5
fee-address: user:treasury
payment-token: program:payment
base-uri: ipfs://set0/
contract-uri: ipfs://collection
max-supply: 10
royalty-numerator: 500
)";

TEST( deployment, parse )
{
  auto bundle = config::parse_deployment( YAML::Load( deployment_yaml ) );

  EXPECT_EQ( bundle.name, "Genesis Collection" );
  EXPECT_EQ( bundle.symbol, "GEN" );
  EXPECT_EQ( bundle.owner, protocol::user_account( "alice" ) );
  EXPECT_EQ( bundle.coin_fee, 100 );
  EXPECT_EQ( bundle.token_fee, 5 );
  EXPECT_EQ( bundle.fee_address, protocol::user_account( "treasury" ) );
  EXPECT_EQ( bundle.payment_token, protocol::program_account( "payment" ) );
  EXPECT_EQ( bundle.base_uri, "ipfs://set0/" );
  EXPECT_EQ( bundle.contract_uri, "ipfs://collection" );
  EXPECT_EQ( bundle.max_supply, 10 );
  EXPECT_EQ( bundle.royalty_numerator, 500 );
}

TEST( deployment, defaults_and_missing_fields )
{
  auto node = YAML::Load( deployment_yaml );
  node.remove( "coin-fee" );
  node.remove( "contract-uri" );

  auto bundle = config::parse_deployment( node );
  EXPECT_EQ( bundle.coin_fee, 0 );
  EXPECT_TRUE( bundle.contract_uri.empty() );

  node.remove( "max-supply" );
  EXPECT_THROW( config::parse_deployment( node ), std::invalid_argument );

  EXPECT_THROW( config::parse_deployment( YAML::Load( "[1, 2]" ) ), std::invalid_argument );
}

TEST( deployment, royalty_limit )
{
  auto node                   = YAML::Load( deployment_yaml );
  node[ "royalty-numerator" ] = 10'001;
  EXPECT_THROW( config::parse_deployment( node ), std::invalid_argument );
}

TEST( deployment, accounts )
{
  auto alice = protocol::user_account( "alice" );

  EXPECT_EQ( config::parse_account( "user:alice" ), alice );
  EXPECT_EQ( config::parse_account( encode::to_hex( alice ) ), alice );
  EXPECT_TRUE( config::parse_account( "program:sale" ).program() );

  EXPECT_THROW( config::parse_account( "user:" ), std::invalid_argument );
  EXPECT_THROW( config::parse_account( "alice" ), std::invalid_argument );
  EXPECT_THROW( config::parse_account( "0x1234" ), std::invalid_argument );
}

TEST( scenario, parse )
{
  auto root = YAML::Load( R"(
minter: program:sale
deployment:
  name: Genesis Collection
  symbol: GEN
  owner: user:alice
  fee-address: user:treasury
  payment-token: program:payment
  base-uri: ipfs://set0/
  max-supply: 10
payment-token:
  name: Payment
  symbol: PAY
  supply: 1000
  holder: user:alice
genesis:
  - account: user:bob
    balance: 5000
script:
  - action: pause
    signer: user:alice
    paused: false
  - action: mint
    signer: user:bob
    quantity: 3
    value: 300
  - action: set-base-uri
    signer: user:alice
    set: 1
    max-supply: 5
    uri: ipfs://set1/
)" );

  auto s = config::parse_scenario( root );

  EXPECT_EQ( s.minter, protocol::program_account( "sale" ) );
  EXPECT_EQ( s.payment_token.supply, 1'000 );
  EXPECT_EQ( s.payment_token.decimals, 8 );
  EXPECT_EQ( s.payment_token.holder, protocol::user_account( "alice" ) );

  ASSERT_EQ( s.genesis.size(), 1 );
  EXPECT_EQ( s.genesis[ 0 ].account, protocol::user_account( "bob" ) );
  EXPECT_EQ( s.genesis[ 0 ].balance, 5'000 );

  ASSERT_EQ( s.script.size(), 3 );
  EXPECT_EQ( s.script[ 0 ].type, config::action_type::pause );
  EXPECT_FALSE( s.script[ 0 ].flag );
  EXPECT_EQ( s.script[ 1 ].type, config::action_type::mint );
  EXPECT_EQ( s.script[ 1 ].amount, 3 );
  EXPECT_EQ( s.script[ 1 ].value, 300 );
  EXPECT_EQ( s.script[ 2 ].type, config::action_type::set_base_uri );
  EXPECT_EQ( s.script[ 2 ].set, 1 );
  EXPECT_EQ( s.script[ 2 ].max_supply, 5 );
  EXPECT_EQ( s.script[ 2 ].counter, 0 );
  EXPECT_EQ( s.script[ 2 ].uri, "ipfs://set1/" );

  root[ "script" ][ 0 ][ "action" ] = "unpause";
  EXPECT_THROW( config::parse_scenario( root ), std::invalid_argument );
}

TEST( options, lookup_order )
{
  namespace po = boost::program_options;

  po::options_description options;
  options.add_options()( "log-level,l", po::value< std::string >() );

  auto service = YAML::Load( "log-level: debug\nscenario: service.yml" );
  auto global  = YAML::Load( "log-level: error\nscenario: global.yml\nbasedir: /tmp" );

  po::variables_map none;
  EXPECT_EQ( config::get_option< std::string >( "log-level,l", "info", none, service, global ), "debug" );
  EXPECT_EQ( config::get_option< std::string >( "basedir", ".", none, service, global ), "/tmp" );
  EXPECT_EQ( config::get_option< std::string >( "missing", "fallback", none, service, global ), "fallback" );

  const char* argv[] = { "setmint", "-l", "warning" };
  po::variables_map args;
  po::store( po::parse_command_line( 3, argv, options ), args );
  EXPECT_EQ( config::get_option< std::string >( "log-level,l", "info", args, service, global ), "warning" );
}

// NOLINTEND
