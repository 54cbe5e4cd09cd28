#include <setmint/controller/controller.hpp>
#include <setmint/controller/execution_context.hpp>
#include <setmint/controller/state.hpp>

#include <setmint/crypto.hpp>
#include <setmint/log.hpp>
#include <setmint/protocol/serialization.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>

namespace setmint::controller {

controller::controller() = default;

controller::~controller()
{
  close();
}

void controller::open( const state::genesis_data& data )
{
  _db.open(
    [ & ]( state_db::state_node_ptr& root )
    {
      for( const auto& entry: data )
      {
        if( root->get( entry.space, entry.key ) )
          throw std::runtime_error( "encountered unexpected object in initial state" );

        root->put( entry.space, entry.key, entry.value );
      }
      LOG_INFO( setmint::log::instance(), "Wrote {} genesis objects into new database", data.size() );
    } );

  auto h = head();
  LOG_INFO( setmint::log::instance(),
            "Opened database at block - Height: {}, ID: {}",
            h.height,
            setmint::log::hex{ h.id.data(), h.id.size() } );
}

void controller::close()
{
  _db.close();
}

void controller::register_program( const protocol::account& id, std::shared_ptr< program::program > p )
{
  if( !id.program() )
    throw std::invalid_argument( "programs must be registered under a program account" );

  if( !p )
    throw std::invalid_argument( "program must not be null" );

  _registry.insert_or_assign( id, std::move( p ) );
  LOG_DEBUG( setmint::log::instance(), "Registered program {}", setmint::log::hex{ id.data(), id.size() } );
}

result< protocol::block_receipt > controller::process( const protocol::block& block,
                                                       std::chrono::system_clock::time_point now )
{
  if( !block.validate() )
    return std::unexpected( controller_errc::malformed_block );

  static constexpr std::chrono::seconds time_delta = std::chrono::seconds( 5 );

  auto time_upper_bound = static_cast< std::uint64_t >(
    std::chrono::duration_cast< std::chrono::milliseconds >( ( now + time_delta ).time_since_epoch() ).count() );

  const auto& block_id = block.id;
  auto parent_info     = head();

  if( block.previous != parent_info.id )
    return std::unexpected( controller_errc::unknown_previous_block );

  if( block.height != parent_info.height + 1 )
    return std::unexpected( controller_errc::unexpected_height );

  if( block.timestamp > time_upper_bound || block.timestamp <= parent_info.time )
    return std::unexpected( controller_errc::timestamp_out_of_bounds );

  LOG_DEBUG( setmint::log::instance(),
             "Pushing block - Height: {}, ID: {}",
             block.height,
             setmint::log::hex{ block_id.data(), block_id.size() } );

  auto parent_node = _db.head();
  auto block_node  = parent_node->make_child();

  execution_context context( _registry, intent::block_application );
  context.set_state_node( block_node );
  context.set_entropy( protocol::make_entropy( block ) );

  return context.apply( block ).and_then(
    [ & ]( auto&& receipt ) -> result< protocol::block_receipt >
    {
      state::head info{ .id = block_id, .height = block.height, .previous = block.previous, .time = block.timestamp };
      block_node->put( state::space::metadata(), state::key::head(), protocol::to_binary( info ) );
      parent_node->commit( *block_node, block_id, block.height );

      LOG_INFO( setmint::log::instance(),
                "Block applied - Height: {}, ID: {} [{} transaction(s)]",
                block.height,
                setmint::log::hex{ block_id.data(), block_id.size() },
                block.transactions.size() );

      for( const auto& transaction_receipt: receipt.transaction_receipts )
        if( transaction_receipt.reverted )
          LOG_INFO( setmint::log::instance(),
                    "Transaction reverted - ID: {}, reason: {}",
                    setmint::log::hex{ transaction_receipt.id.data(), transaction_receipt.id.size() },
                    transaction_receipt.message );

      return receipt;
    } );
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !transaction.validate() )
    return std::unexpected( controller_errc::malformed_transaction );

  LOG_DEBUG( setmint::log::instance(),
             "Pushing transaction - ID: {}",
             setmint::log::hex{ transaction.id.data(), transaction.id.size() } );

  auto parent_info = head();

  execution_context context( _registry, intent::transaction_application );
  context.set_state_node( _db.head()->make_child() );
  context.set_entropy( crypto::hash_all( parent_info.id, transaction.id ) );

  return context.apply( transaction )
    .and_then(
      [ & ]( auto&& receipt ) -> result< protocol::transaction_receipt >
      {
        LOG_DEBUG( setmint::log::instance(),
                   "Transaction applied - ID: {}",
                   setmint::log::hex{ transaction.id.data(), transaction.id.size() } );
        return receipt;
      } );
}

state::head controller::head() const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.head();
}

result< protocol::program_output > controller::read_program( const protocol::account& account,
                                                             const protocol::program_input& input ) const
{
  auto parent_info = head();

  execution_context context( _registry );
  context.set_state_node( _db.head()->make_child() );
  context.set_entropy( crypto::hash_all( parent_info.id ) );

  return context.read_program( account, input );
}

std::uint64_t controller::account_nonce( const protocol::account& account ) const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.account_nonce( account );
}

std::uint64_t controller::balance_of( const protocol::account& account ) const
{
  execution_context context( _registry );
  context.set_state_node( _db.head() );
  return context.account_balance( account );
}

} // namespace setmint::controller
