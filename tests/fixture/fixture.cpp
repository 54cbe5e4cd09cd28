// NOLINTBEGIN

#include <test/fixture.hpp>

#include <setmint/controller.hpp>
#include <setmint/log.hpp>
#include <setmint/protocol.hpp>

namespace test {

fixture::fixture( const std::string& log_level )
{
  setmint::log::initialize( log_level );

  _controller = std::make_unique< setmint::controller::controller >();

  for( const auto& account: { alice, bob, carol } )
    _genesis_data.push_back( setmint::controller::state::genesis_balance( account, initial_coin_balance ) );

  _controller->open( _genesis_data );
}

fixture::~fixture()
{
  _controller->close();
}

setmint::protocol::operation fixture::make_call_operation( const setmint::protocol::account& id,
                                                           std::vector< std::byte >&& stdin,
                                                           std::uint64_t value )
{
  setmint::protocol::call_program op;
  op.id          = id;
  op.value       = value;
  op.input.stdin = std::move( stdin );
  return op;
}

setmint::protocol::operation fixture::make_transfer_operation( const setmint::protocol::account& to,
                                                               std::uint64_t value )
{
  setmint::protocol::transfer op;
  op.to    = to;
  op.value = value;
  return op;
}

setmint::controller::result< setmint::protocol::transaction_receipt >
fixture::submit( const setmint::protocol::account& signer, setmint::protocol::operation op )
{
  auto receipt = _controller->process( make_block( make_transaction( signer, std::move( op ) ) ) );
  if( !receipt )
    return std::unexpected( receipt.error() );

  return receipt->transaction_receipts.front();
}

bool fixture::verify( setmint::controller::result< setmint::protocol::block_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( setmint::log::instance(), "Block submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::head )
  {
    auto head = _controller->head();
    if( receipt->id != head.id )
    {
      LOG_ERROR( setmint::log::instance(),
                 "Block ID {} does not match head {}",
                 setmint::log::hex{ receipt->id.data(), receipt->id.size() },
                 setmint::log::hex{ head.id.data(), head.id.size() } );
      return false;
    }
  }

  if( flags & verification::without_reversion )
  {
    for( const auto& tx_receipt: receipt->transaction_receipts )
    {
      if( tx_receipt.reverted )
      {
        LOG_ERROR( setmint::log::instance(),
                   "Transaction ID {} was reverted: {}",
                   setmint::log::hex{ tx_receipt.id.data(), tx_receipt.id.size() },
                   tx_receipt.message );
        return false;
      }
    }
  }

  return true;
}

bool fixture::verify( setmint::controller::result< setmint::protocol::transaction_receipt > receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( setmint::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  if( flags & verification::without_reversion )
  {
    if( receipt->reverted )
    {
      LOG_ERROR( setmint::log::instance(),
                 "Transaction ID {} was reverted: {}",
                 setmint::log::hex{ receipt->id.data(), receipt->id.size() },
                 receipt->message );
      return false;
    }
  }

  return true;
}

setmint::protocol::program_input fixture::make_input( std::vector< std::byte >&& stdin,
                                                      std::vector< std::string >&& arguments ) const noexcept
{
  setmint::protocol::program_input input;
  input.stdin     = std::move( stdin );
  input.arguments = std::move( arguments );
  return input;
}

} // namespace test

// NOLINTEND
