#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <setmint/config/deployment.hpp>
#include <setmint/config/options.hpp>
#include <setmint/config/scenario.hpp>
#include <setmint/controller/controller.hpp>
#include <setmint/encode.hpp>
#include <setmint/log.hpp>
#include <setmint/program/io.hpp>
#include <setmint/program/minter.hpp>
#include <setmint/program/token.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service_name = "setmint"s;

constexpr auto help_option       = "help,h"s;
constexpr auto version_option    = "version,v"s;
constexpr auto basedir_option    = "basedir,d"s;
constexpr auto basedir_default   = "."s;
constexpr auto log_level_option  = "log-level,l"s;
constexpr auto log_level_default = "info"s;
constexpr auto scenario_option   = "scenario,s"s;
constexpr auto scenario_default  = "scenario.yml"s;

} // namespace constants

using namespace setmint;

const std::string& version_string();

/**
 * Wraps transactions into blocks on top of the controller's head.
 */
class block_producer
{
public:
  block_producer( controller::controller& c ):
      _controller( c )
  {}

  protocol::transaction make_transaction( const protocol::account& signer, protocol::operation op )
  {
    protocol::transaction t;
    t.signer = signer;
    t.nonce  = _controller.account_nonce( signer ) + 1;
    t.operations.emplace_back( std::move( op ) );
    t.id = protocol::make_id( t );
    return t;
  }

  controller::result< protocol::block_receipt > produce( std::vector< protocol::transaction > transactions )
  {
    auto head = _controller.head();
    auto now  = std::chrono::system_clock::now();
    auto now_ms =
      static_cast< std::uint64_t >( std::chrono::duration_cast< std::chrono::milliseconds >( now.time_since_epoch() ).count() );

    protocol::block b;
    b.previous     = head.id;
    b.height       = head.height + 1;
    b.timestamp    = std::max( now_ms, head.time + 1 );
    b.transactions = std::move( transactions );
    b.id           = protocol::make_id( b );

    return _controller.process( b, now );
  }

private:
  controller::controller& _controller;
};

static protocol::call_program
make_call( const protocol::account& id, std::vector< std::byte > stdin, std::uint64_t value = 0 )
{
  protocol::call_program call;
  call.id          = id;
  call.value       = value;
  call.input.stdin = std::move( stdin );
  return call;
}

static protocol::call_program make_action_call( const config::scenario& s, const config::action& a )
{
  using instruction = program::minter::instruction;

  switch( a.type )
  {
    case config::action_type::approve:
      return make_call( s.deployment.payment_token,
                        program::make_stdin( program::token::instruction::approve, s.minter, a.amount ) );
    case config::action_type::mint:
      return make_call( s.minter, program::make_stdin( instruction::mint, a.amount ), a.value );
    case config::action_type::pause:
      return make_call( s.minter, program::make_stdin( instruction::pause, a.flag ) );
    case config::action_type::start_set:
      return make_call( s.minter, program::make_stdin( instruction::start_set, a.set ) );
    case config::action_type::set_base_uri:
      return make_call( s.minter,
                        program::make_stdin( instruction::set_base_uri, a.set, a.max_supply, a.counter, a.uri ) );
    case config::action_type::set_coin_fee:
      return make_call( s.minter, program::make_stdin( instruction::set_coin_fee, a.amount ) );
    case config::action_type::set_token_fee:
      return make_call( s.minter, program::make_stdin( instruction::set_token_fee, a.amount ) );
    case config::action_type::set_batch_limit:
      return make_call( s.minter, program::make_stdin( instruction::set_batch_limit, a.amount ) );
    case config::action_type::withdraw_coin:
      return make_call( s.minter, program::make_stdin( instruction::withdraw_coin, a.target ) );
    case config::action_type::withdraw_tokens:
      return make_call( s.minter,
                        program::make_stdin( instruction::withdraw_tokens, s.deployment.payment_token, a.target ) );
    case config::action_type::transfer:
      return make_call( s.minter, program::make_stdin( instruction::transfer, a.target, a.token_id ) );
    case config::action_type::burn:
      return make_call( s.minter, program::make_stdin( instruction::burn, a.token_id ) );
  }
  std::unreachable();
}

static void report( const protocol::block_receipt& receipt )
{
  for( const auto& transaction_receipt: receipt.transaction_receipts )
  {
    if( transaction_receipt.reverted )
    {
      LOG_WARNING( setmint::log::instance(),
                   "Transaction {} reverted: {}",
                   setmint::log::hex{ transaction_receipt.id.data(), transaction_receipt.id.size() },
                   transaction_receipt.message );
      continue;
    }

    for( const auto& event: transaction_receipt.events )
      LOG_INFO( setmint::log::instance(),
                "Event {} from {}",
                event.name,
                setmint::log::hex{ event.source.data(), event.source.size() } );
  }
}

static controller::result< protocol::program_output >
read( const controller::controller& c, const protocol::account& id, std::vector< std::byte > stdin )
{
  protocol::program_input input;
  input.stdin = std::move( stdin );
  return c.read_program( id, input );
}

static void summarize( const controller::controller& c, const config::scenario& s )
{
  using instruction = program::minter::instruction;

  auto total = read( c, s.minter, program::make_stdin( instruction::total_supply ) )
                 .and_then(
                   []( auto&& output )
                   {
                     return program::decode_integer< std::uint64_t >( output.stdout );
                   } );

  if( !total )
  {
    LOG_ERROR( setmint::log::instance(), "Unable to read total supply: {}", total.error().message() );
    return;
  }

  LOG_INFO( setmint::log::instance(), "Total supply: {}", *total );

  constexpr std::uint64_t max_consecutive_misses = 1'000;

  // Burned ids are skipped, so walk until every live token has been found
  std::uint64_t found = 0, misses = 0;
  for( std::uint64_t id = 1; found < *total && misses < max_consecutive_misses; ++id )
  {
    auto uri   = read( c, s.minter, program::make_stdin( instruction::token_uri, id ) );
    auto owner = read( c, s.minter, program::make_stdin( instruction::owner_of, id ) );

    if( !uri || !owner )
    {
      ++misses;
      continue;
    }

    misses = 0;
    ++found;
    LOG_INFO( setmint::log::instance(),
              "Token {} -> {} owned by {}",
              id,
              memory::as_string_view( uri->stdout ),
              encode::to_hex( owner->stdout ) );
  }

  auto fee_balance = c.balance_of( s.deployment.fee_address );
  LOG_INFO( setmint::log::instance(), "Fee address coin balance: {}", fee_balance );
}

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path scenario_file;
  config::scenario scenario;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()     , "Print this help message and exit" )
      ( constants::version_option.data()  , "Print version string and exit" )
      ( constants::basedir_option.data()  , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Base directory holding config.yml" )
      ( constants::log_level_option.data(), boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::scenario_option.data() , boost::program_options::value< std::string >(), "The sale scenario file (absolute path or relative to basedir)" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node root_config;
    YAML::Node global_config;
    YAML::Node service_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      root_config    = YAML::LoadFile( yaml_config.string() );
      global_config  = root_config[ "global" ];
      service_config = root_config[ constants::service_name ];
    }

    // clang-format off
    log_level     = config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, service_config, global_config );
    scenario_file = std::filesystem::path( config::get_option< std::string >( constants::scenario_option, constants::scenario_default, args, service_config, global_config ) );
    // clang-format on

    setmint::log::initialize( log_level );

    LOG_INFO( setmint::log::instance(), "{}", version_string() );

    if( root_config.IsNull() )
      LOG_WARNING( setmint::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( scenario_file.is_relative() )
      scenario_file = basedir / scenario_file;

    if( !std::filesystem::exists( scenario_file ) )
      throw std::runtime_error( "unable to locate scenario file at " + scenario_file.string() );

    scenario = config::parse_scenario( YAML::LoadFile( scenario_file.string() ) );
  }
  catch( const std::exception& e )
  {
    std::cerr << "Invalid argument: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  controller::controller controller;

  try
  {
    controller.register_program(
      scenario.deployment.payment_token,
      std::make_shared< program::token >( scenario.payment_token.holder,
                                          scenario.payment_token.name,
                                          scenario.payment_token.symbol,
                                          scenario.payment_token.decimals ) );
    controller.register_program( scenario.minter, std::make_shared< program::minter >( scenario.deployment.owner ) );

    controller::state::genesis_data genesis;
    for( const auto& entry: scenario.genesis )
      genesis.push_back( controller::state::genesis_balance( entry.account, entry.balance ) );

    controller.open( genesis );

    block_producer producer( controller );

    std::vector< protocol::transaction > setup;
    if( scenario.payment_token.supply )
      setup.push_back( producer.make_transaction(
        scenario.payment_token.holder,
        make_call( scenario.deployment.payment_token,
                   program::make_stdin( program::token::instruction::mint,
                                        scenario.payment_token.holder,
                                        scenario.payment_token.supply ) ) ) );

    auto initializer = producer.make_transaction(
      scenario.deployment.owner,
      make_call( scenario.minter, program::make_initialize_input( scenario.deployment ) ) );

    // Both setup transactions may share a signer
    if( !setup.empty() && setup.front().signer == initializer.signer )
    {
      initializer.nonce++;
      initializer.id = protocol::make_id( initializer );
    }
    setup.push_back( std::move( initializer ) );

    auto receipt = producer.produce( std::move( setup ) );
    if( !receipt )
      throw std::runtime_error( "deployment rejected: " + receipt.error().message() );

    report( *receipt );

    for( const auto& action: scenario.script )
    {
      receipt = producer.produce( { producer.make_transaction( action.signer, make_action_call( scenario, action ) ) } );
      if( !receipt )
      {
        LOG_ERROR( setmint::log::instance(), "Block rejected: {}", receipt.error().message() );
        retcode = EXIT_FAILURE;
        break;
      }

      report( *receipt );
    }

    summarize( controller, scenario );
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( setmint::log::instance(), "An unexpected error has occurred: {}", e.what() );
    retcode = EXIT_FAILURE;
  }

  controller.close();

  LOG_INFO( setmint::log::instance(), "Shut down gracefully" );

  return retcode;
}

const std::string& version_string()
{
  static std::string v_str = "Setmint v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                             + std::to_string( PROJECT_MINOR_VERSION ) + "." + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}
