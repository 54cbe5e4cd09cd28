#include <setmint/encode.hpp>
#include <setmint/program/io.hpp>
#include <setmint/program/minter.hpp>
#include <setmint/program/storage.hpp>
#include <setmint/program/token.hpp>

#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace setmint::program {

static constexpr std::uint32_t collection_space = 0;
static constexpr std::uint32_t set_space        = 1;
static constexpr std::uint32_t pool_space       = 2;
static constexpr std::uint32_t token_space      = 3;
static constexpr std::uint32_t balance_space    = 4;

static constexpr std::span< const std::byte > collection_key{};

template< typename T >
static std::error_code assign( result< T >&& r, T& out )
{
  if( !r )
    return r.error();

  out = std::move( *r );
  return program_errc::ok;
}

template< typename T >
static std::error_code
emit( system_interface* system, std::string_view name, const T& data, const std::vector< protocol::account >& impacted )
{
  return system->event( name, protocol::to_binary( data ), impacted );
}

static std::error_code store_collection( system_interface* system, const minter::collection_record& collection )
{
  return put_record( system, collection_space, collection_key, collection );
}

static result< minter::set_record > load_set( system_interface* system, std::uint64_t set )
{
  return get_record< minter::set_record >( system, set_space, memory::to_big_endian( set ) )
    .transform(
      []( auto&& record )
      {
        return record.value_or( minter::set_record{} );
      } );
}

static std::error_code store_set( system_interface* system, std::uint64_t set, const minter::set_record& record )
{
  return put_record( system, set_space, memory::to_big_endian( set ), record );
}

static result< minter::token_record > load_token( system_interface* system, std::uint64_t id )
{
  return get_record< minter::token_record >( system, token_space, memory::to_big_endian( id ) )
    .and_then(
      []( auto&& record ) -> result< minter::token_record >
      {
        if( !record )
          return std::unexpected( program_errc::nonexistent_token );

        return *record;
      } );
}

static std::error_code
adjust_balance( system_interface* system, const protocol::account& account, std::uint64_t add, std::uint64_t sub )
{
  auto balance = get_integer( system, balance_space, account );
  if( !balance )
    return balance.error();

  if( *balance < sub || std::numeric_limits< std::uint64_t >::max() - add < *balance - sub )
    return program_errc::overflow;

  return put_integer( system, balance_space, account, *balance - sub + add );
}

static std::error_code require_owner( system_interface* system, const minter::collection_record& collection )
{
  const auto& caller = system->get_caller();

  if( caller != collection.owner )
  {
    if( auto error = write_error( system, "unauthorized caller " + encode::to_hex( caller ) ); error )
      return error;

    return program_errc::unauthorized;
  }

  return program_errc::ok;
}

static result< std::uint64_t > checked_multiply( std::uint64_t fee, std::uint64_t quantity )
{
  if( fee != 0 && quantity > std::numeric_limits< std::uint64_t >::max() / fee )
    return std::unexpected( program_errc::overflow );

  return fee * quantity;
}

minter::minter( const protocol::account& deployer, std::shared_ptr< random_source > source ):
    _deployer( deployer ),
    _random( std::move( source ) )
{}

std::error_code minter::run( system_interface* system, std::span< const std::string > arguments )
{
  auto instr = read_integer< std::uint32_t >( system );
  if( !instr )
    return instr.error();

  if( *instr > std::to_underlying( instruction::burn ) )
    return program_errc::invalid_instruction;

  auto op = static_cast< instruction >( *instr );

  if( op == instruction::initialize )
    return initialize( system );

  auto collection = get_record< collection_record >( system, collection_space, collection_key );
  if( !collection )
    return collection.error();

  if( !collection->has_value() )
    return program_errc::not_initialized;

  auto& record = collection->value();

  switch( op )
  {
    case instruction::mint:
      if( record.entered )
        return program_errc::reentrant_call;

      return mint( system, record );

    case instruction::set_token_fee:
    case instruction::set_coin_fee:
    case instruction::set_fee_address:
    case instruction::set_batch_limit:
    case instruction::set_base_uri:
    case instruction::set_contract_uri:
    case instruction::set_royalty:
    case instruction::pause:
    case instruction::start_set:
    case instruction::withdraw_coin:
    case instruction::withdraw_tokens:
    case instruction::transfer_ownership:
      if( record.entered )
        return program_errc::reentrant_call;

      return administer( system, op, record );

    case instruction::transfer:
      if( record.entered )
        return program_errc::reentrant_call;

      return transfer( system, record );

    case instruction::burn:
      if( record.entered )
        return program_errc::reentrant_call;

      return burn( system, record );

    default:
      return query( system, op, record );
  }
}

std::error_code minter::initialize( system_interface* system )
{
  if( system->get_caller() != _deployer )
    return program_errc::unauthorized;

  if( !system->get_object( collection_space, collection_key ).empty() )
    return program_errc::already_initialized;

  deployment_bundle bundle;

  if( auto error = assign( read_string( system ), bundle.name ); error )
    return error;
  if( auto error = assign( read_string( system ), bundle.symbol ); error )
    return error;
  if( auto error = assign( read_account( system ), bundle.owner ); error )
    return error;
  if( auto error = assign( read_integer< std::uint64_t >( system ), bundle.coin_fee ); error )
    return error;
  if( auto error = assign( read_integer< std::uint64_t >( system ), bundle.token_fee ); error )
    return error;
  if( auto error = assign( read_account( system ), bundle.fee_address ); error )
    return error;
  if( auto error = assign( read_account( system ), bundle.payment_token ); error )
    return error;
  if( auto error = assign( read_string( system ), bundle.base_uri ); error )
    return error;
  if( auto error = assign( read_string( system ), bundle.contract_uri ); error )
    return error;
  if( auto error = assign( read_integer< std::uint64_t >( system ), bundle.max_supply ); error )
    return error;
  if( auto error = assign( read_integer< std::uint64_t >( system ), bundle.royalty_numerator ); error )
    return error;

  if( bundle.owner.null() || bundle.fee_address.null() || bundle.payment_token.null() )
    return program_errc::zero_address;

  if( bundle.base_uri.empty() || bundle.max_supply == 0 )
    return program_errc::set_not_configured;

  if( bundle.royalty_numerator > royalty_denominator )
    return program_errc::royalty_too_high;

  collection_record collection{ .owner             = bundle.owner,
                                .name              = std::move( bundle.name ),
                                .symbol            = std::move( bundle.symbol ),
                                .coin_fee          = bundle.coin_fee,
                                .token_fee         = bundle.token_fee,
                                .fee_address       = bundle.fee_address,
                                .payment_token     = bundle.payment_token,
                                .royalty_receiver  = bundle.fee_address,
                                .royalty_numerator = bundle.royalty_numerator,
                                .contract_uri      = std::move( bundle.contract_uri ) };

  if( auto error = store_set( system, 0, set_record{ .max_supply = bundle.max_supply, .base_uri = bundle.base_uri } );
      error )
    return error;

  if( auto error = display_pool( system, pool_space ).reset( bundle.max_supply ); error )
    return error;

  if( auto error = store_collection( system, collection ); error )
    return error;

  system->log( "initialized " + collection.name + " with " + std::to_string( bundle.max_supply ) + " tokens in set 0" );

  return emit( system,
               "minter.ownership_transferred",
               update_event< protocol::account >{ .actor = system->get_caller(), .value = collection.owner },
               { collection.owner } );
}

std::error_code minter::mint( system_interface* system, collection_record& collection )
{
  auto quantity = read_integer< std::uint64_t >( system );
  if( !quantity )
    return quantity.error();

  if( collection.paused )
    return program_errc::contract_paused;

  if( *quantity < 1 )
    return program_errc::insufficient_mint_quantity;

  if( *quantity > collection.batch_limit )
    return program_errc::exceeds_batch_limit;

  auto set = load_set( system, collection.current_set );
  if( !set )
    return set.error();

  if( set->counter > set->max_supply || *quantity > set->max_supply - set->counter )
    return program_errc::exceeds_max_supply;

  auto total_token_fee = checked_multiply( collection.token_fee, *quantity );
  if( !total_token_fee )
    return total_token_fee.error();

  auto total_coin_fee = checked_multiply( collection.coin_fee, *quantity );
  if( !total_coin_fee )
    return total_coin_fee.error();

  protocol::account caller = system->get_caller();

  if( collection.token_fee > 0 )
  {
    auto output = system->call_program( collection.payment_token,
                                        make_stdin( token::instruction::balance_of, caller ) );
    if( !output )
      return program_errc::token_transfer_failed;

    auto balance = decode_integer< std::uint64_t >( output->stdout );
    if( !balance )
      return program_errc::token_transfer_failed;

    if( *balance < *total_token_fee )
    {
      if( auto error = write_error( system,
                                    "balance " + std::to_string( *balance ) + ", required "
                                      + std::to_string( *total_token_fee ) );
          error )
        return error;

      return program_errc::insufficient_token_balance;
    }
  }

  if( collection.coin_fee > 0 && system->get_value() < *total_coin_fee )
  {
    if( auto error = write_error( system,
                                  "provided " + std::to_string( system->get_value() ) + ", required "
                                    + std::to_string( *total_coin_fee ) );
        error )
      return error;

    return program_errc::insufficient_coin_fee;
  }

  collection.entered = true;
  if( auto error = store_collection( system, collection ); error )
    return error;

  if( auto error = collect_fees( system, collection, *total_token_fee, *total_coin_fee ); error )
    return error;

  display_pool pool( system, pool_space );

  for( std::uint64_t i = 0; i < *quantity; ++i )
  {
    auto id     = collection.next_token_id++;
    auto number = pool.draw( _random->next( system, id ) );
    if( !number )
      return number.error();

    token_record token{ .owner = caller, .set = collection.current_set, .display_number = *number };

    if( auto error = put_record( system, token_space, memory::to_big_endian( id ), token ); error )
      return error;

    if( auto error = emit( system,
                           "minter.minted",
                           mint_event{ .to             = caller,
                                       .token_id       = id,
                                       .set            = collection.current_set,
                                       .display_number = *number },
                           { caller } );
        error )
      return error;
  }

  set->counter += *quantity;
  if( auto error = store_set( system, collection.current_set, *set ); error )
    return error;

  if( auto error = adjust_balance( system, caller, *quantity, 0 ); error )
    return error;

  collection.entered = false;
  return store_collection( system, collection );
}

std::error_code minter::collect_fees( system_interface* system,
                                      const collection_record& collection,
                                      std::uint64_t total_token_fee,
                                      std::uint64_t total_coin_fee )
{
  protocol::account caller = system->get_caller();

  if( collection.token_fee > 0 )
  {
    auto output = system->call_program(
      collection.payment_token,
      make_stdin( token::instruction::transfer_from, caller, collection.fee_address, total_token_fee ) );

    if( !output )
      return program_errc::token_transfer_failed;

    auto success = decode_bool( output->stdout );
    if( !success || !*success )
      return program_errc::token_transfer_failed;
  }

  if( collection.coin_fee > 0 )
  {
    if( system->transfer_value( collection.fee_address, total_coin_fee ) )
      return program_errc::coin_transfer_failed;

    if( auto excess = system->get_value() - total_coin_fee; excess > 0 )
      if( system->transfer_value( caller, excess ) )
        return program_errc::coin_transfer_failed;
  }

  return program_errc::ok;
}

std::error_code minter::administer( system_interface* system, instruction instr, collection_record& collection )
{
  if( auto error = require_owner( system, collection ); error )
    return error;

  protocol::account actor = system->get_caller();
  std::error_code error;

  switch( instr )
  {
    case instruction::set_token_fee:
    case instruction::set_coin_fee:
      {
        auto fee = read_integer< std::uint64_t >( system );
        if( !fee )
          return fee.error();

        bool token_fee = instr == instruction::set_token_fee;
        ( token_fee ? collection.token_fee : collection.coin_fee ) = *fee;

        error = emit( system,
                      token_fee ? "minter.token_fee_updated" : "minter.coin_fee_updated",
                      update_event< std::uint64_t >{ .actor = actor, .value = *fee },
                      { actor } );
        break;
      }
    case instruction::set_fee_address:
      {
        auto fee_address = read_account( system );
        if( !fee_address )
          return fee_address.error();

        if( fee_address->null() )
          return program_errc::zero_address;

        collection.fee_address = *fee_address;

        error = emit( system,
                      "minter.fee_address_updated",
                      update_event< protocol::account >{ .actor = actor, .value = *fee_address },
                      { actor, *fee_address } );
        break;
      }
    case instruction::set_batch_limit:
      {
        auto limit = read_integer< std::uint64_t >( system );
        if( !limit )
          return limit.error();

        if( *limit > max_batch_limit )
          return program_errc::batch_limit_too_high;

        collection.batch_limit = *limit;

        error = emit( system,
                      "minter.batch_limit_updated",
                      update_event< std::uint64_t >{ .actor = actor, .value = *limit },
                      { actor } );
        break;
      }
    case instruction::set_base_uri:
      {
        set_update update;

        if( auto e = assign( read_integer< std::uint64_t >( system ), update.set ); e )
          return e;
        if( auto e = assign( read_integer< std::uint64_t >( system ), update.record.max_supply ); e )
          return e;
        if( auto e = assign( read_integer< std::uint64_t >( system ), update.record.counter ); e )
          return e;
        if( auto e = assign( read_string( system ), update.record.base_uri ); e )
          return e;

        if( update.record.counter > update.record.max_supply )
          return program_errc::invalid_argument;

        if( auto e = store_set( system, update.set, update.record ); e )
          return e;

        error = emit( system,
                      "minter.base_uri_updated",
                      update_event< set_update >{ .actor = actor, .value = update },
                      { actor } );
        break;
      }
    case instruction::set_contract_uri:
      {
        auto uri = read_string( system );
        if( !uri )
          return uri.error();

        collection.contract_uri = *uri;

        error = emit( system,
                      "minter.contract_uri_updated",
                      update_event< std::string >{ .actor = actor, .value = *uri },
                      { actor } );
        break;
      }
    case instruction::set_royalty:
      {
        royalty_update update;

        if( auto e = assign( read_account( system ), update.receiver ); e )
          return e;
        if( auto e = assign( read_integer< std::uint64_t >( system ), update.numerator ); e )
          return e;

        if( update.receiver.null() )
          return program_errc::zero_address;

        if( update.numerator > royalty_denominator )
          return program_errc::royalty_too_high;

        collection.royalty_receiver  = update.receiver;
        collection.royalty_numerator = update.numerator;

        error = emit( system,
                      "minter.royalty_updated",
                      update_event< royalty_update >{ .actor = actor, .value = update },
                      { actor, update.receiver } );
        break;
      }
    case instruction::pause:
      {
        auto paused = read_bool( system );
        if( !paused )
          return paused.error();

        collection.paused = *paused;

        error = emit( system,
                      "minter.paused_updated",
                      update_event< bool >{ .actor = actor, .value = *paused },
                      { actor } );
        break;
      }
    case instruction::start_set:
      {
        auto set = read_integer< std::uint64_t >( system );
        if( !set )
          return set.error();

        if( *set == collection.current_set )
          return program_errc::set_already_active;

        auto record = load_set( system, *set );
        if( !record )
          return record.error();

        if( record->base_uri.empty() || record->max_supply == 0 )
          return program_errc::set_not_configured;

        if( auto e = display_pool( system, pool_space ).reset( record->max_supply ); e )
          return e;

        collection.current_set = *set;

        system->log( "started set " + std::to_string( *set ) + " with " + std::to_string( record->max_supply )
                     + " display numbers" );

        error = emit( system,
                      "minter.set_started",
                      update_event< std::uint64_t >{ .actor = actor, .value = *set },
                      { actor } );
        break;
      }
    case instruction::withdraw_coin:
      {
        auto receiver = read_account( system );
        if( !receiver )
          return receiver.error();

        if( receiver->null() )
          return program_errc::zero_address;

        auto amount = system->get_balance( system->get_self() );

        if( system->transfer_value( *receiver, amount ) )
          return program_errc::coin_transfer_failed;

        error = emit( system,
                      "minter.withdrawal",
                      update_event< withdrawal >{ .actor = actor, .value = { .receiver = *receiver, .amount = amount } },
                      { actor, *receiver } );
        break;
      }
    case instruction::withdraw_tokens:
      {
        auto token_program = read_account( system );
        auto receiver      = token_program.and_then(
          [ & ]( auto&& )
          {
            return read_account( system );
          } );

        if( !receiver )
          return receiver.error();

        if( receiver->null() )
          return program_errc::zero_address;

        error = withdraw_tokens( system, *token_program, *receiver );
        break;
      }
    case instruction::transfer_ownership:
      {
        auto owner = read_account( system );
        if( !owner )
          return owner.error();

        if( owner->null() )
          return program_errc::zero_address;

        collection.owner = *owner;

        error = emit( system,
                      "minter.ownership_transferred",
                      update_event< protocol::account >{ .actor = actor, .value = *owner },
                      { actor, *owner } );
        break;
      }
    default:
      return program_errc::invalid_instruction;
  }

  if( error )
    return error;

  return store_collection( system, collection );
}

std::error_code
minter::withdraw_tokens( system_interface* system,
                         const protocol::account& token_program,
                         const protocol::account& receiver )
{
  auto output = system->call_program( token_program, make_stdin( token::instruction::balance_of, system->get_self() ) );
  if( !output )
    return program_errc::token_transfer_failed;

  auto amount = decode_integer< std::uint64_t >( output->stdout );
  if( !amount )
    return program_errc::token_transfer_failed;

  output = system->call_program( token_program, make_stdin( token::instruction::transfer, receiver, *amount ) );
  if( !output )
    return program_errc::token_transfer_failed;

  auto success = decode_bool( output->stdout );
  if( !success || !*success )
    return program_errc::token_transfer_failed;

  protocol::account actor = system->get_caller();

  return emit( system,
               "minter.withdrawal",
               update_event< withdrawal >{ .actor = actor,
                                           .value = { .token = token_program, .receiver = receiver, .amount = *amount } },
               { actor, receiver } );
}

std::error_code minter::query( system_interface* system, instruction instr, const collection_record& collection )
{
  switch( instr )
  {
    case instruction::name:
      return write_string( system, collection.name );
    case instruction::symbol:
      return write_string( system, collection.symbol );
    case instruction::owner:
      return write_account( system, collection.owner );
    case instruction::payment_token:
      return write_account( system, collection.payment_token );
    case instruction::token_fee:
      return write_integer( system, collection.token_fee );
    case instruction::coin_fee:
      return write_integer( system, collection.coin_fee );
    case instruction::fee_address:
      return write_account( system, collection.fee_address );
    case instruction::batch_limit:
      return write_integer( system, collection.batch_limit );
    case instruction::contract_uri:
      return write_string( system, collection.contract_uri );
    case instruction::paused:
      return write_bool( system, collection.paused );
    case instruction::current_set:
      return write_integer( system, collection.current_set );
    case instruction::total_supply:
      return write_integer( system, collection.next_token_id - 1 - collection.burned );
    case instruction::max_supply:
    case instruction::counter:
    case instruction::base_uri:
      {
        auto set = read_integer< std::uint64_t >( system ).and_then(
          [ & ]( std::uint64_t s )
          {
            return load_set( system, s );
          } );

        if( !set )
          return set.error();

        if( instr == instruction::max_supply )
          return write_integer( system, set->max_supply );
        else if( instr == instruction::counter )
          return write_integer( system, set->counter );

        return write_string( system, set->base_uri );
      }
    case instruction::token_uri:
    case instruction::owner_of:
      {
        auto token = read_integer< std::uint64_t >( system ).and_then(
          [ & ]( std::uint64_t id )
          {
            return load_token( system, id );
          } );

        if( !token )
          return token.error();

        if( instr == instruction::owner_of )
          return write_account( system, token->owner );

        auto set = load_set( system, token->set );
        if( !set )
          return set.error();

        return write_string( system, set->base_uri + std::to_string( token->display_number ) );
      }
    case instruction::royalty_info:
      {
        std::uint64_t id    = 0;
        std::uint64_t price = 0;

        if( auto error = assign( read_integer< std::uint64_t >( system ), id ); error )
          return error;
        if( auto error = assign( read_integer< std::uint64_t >( system ), price ); error )
          return error;

        // Split the price so the product never exceeds 64 bits
        auto amount = price / royalty_denominator * collection.royalty_numerator
                      + price % royalty_denominator * collection.royalty_numerator / royalty_denominator;

        if( auto error = write_account( system, collection.royalty_receiver ); error )
          return error;

        return write_integer( system, amount );
      }
    case instruction::balance_of:
      {
        auto balance = read_account( system ).and_then(
          [ & ]( auto&& account )
          {
            return get_integer( system, balance_space, account );
          } );

        if( !balance )
          return balance.error();

        return write_integer( system, *balance );
      }
    default:
      return program_errc::invalid_instruction;
  }
}

std::error_code minter::transfer( system_interface* system, collection_record& collection )
{
  auto to = read_account( system );
  auto id = to.and_then(
    [ & ]( auto&& )
    {
      return read_integer< std::uint64_t >( system );
    } );

  if( !id )
    return id.error();

  if( to->null() )
    return program_errc::zero_address;

  auto token = load_token( system, *id );
  if( !token )
    return token.error();

  protocol::account from = system->get_caller();

  if( token->owner != from )
    return program_errc::unauthorized;

  token->owner = *to;

  if( auto error = put_record( system, token_space, memory::to_big_endian( *id ), *token ); error )
    return error;

  if( auto error = adjust_balance( system, from, 0, 1 ); error )
    return error;

  if( auto error = adjust_balance( system, *to, 1, 0 ); error )
    return error;

  return emit( system,
               "minter.transfer",
               transfer_event{ .from = from, .to = *to, .token_id = *id },
               { from, *to } );
}

std::error_code minter::burn( system_interface* system, collection_record& collection )
{
  auto id = read_integer< std::uint64_t >( system );
  if( !id )
    return id.error();

  auto token = load_token( system, *id );
  if( !token )
    return token.error();

  protocol::account from = system->get_caller();

  if( token->owner != from )
    return program_errc::unauthorized;

  if( auto error = system->remove_object( token_space, memory::to_big_endian( *id ) ); error )
    return error;

  if( auto error = adjust_balance( system, from, 0, 1 ); error )
    return error;

  collection.burned++;
  if( auto error = store_collection( system, collection ); error )
    return error;

  return emit( system, "minter.transfer", transfer_event{ .from = from, .token_id = *id }, { from } );
}

std::vector< std::byte > make_initialize_input( const deployment_bundle& bundle )
{
  return make_stdin( minter::instruction::initialize,
                     bundle.name,
                     bundle.symbol,
                     bundle.owner,
                     bundle.coin_fee,
                     bundle.token_fee,
                     bundle.fee_address,
                     bundle.payment_token,
                     bundle.base_uri,
                     bundle.contract_uri,
                     bundle.max_supply,
                     bundle.royalty_numerator );
}

} // namespace setmint::program
