// NOLINTBEGIN

#include <gtest/gtest.h>

#include <setmint/controller.hpp>
#include <setmint/log.hpp>
#include <setmint/memory.hpp>
#include <setmint/program.hpp>
#include <test/fixture.hpp>

using namespace setmint;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "error" ),
      token( protocol::program_account( "token" ) )
  {
    _controller->register_program( token, std::make_shared< program::token >( alice, "Token", "TOKEN" ) );
  }

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  std::uint64_t read_integer( std::vector< std::byte >&& stdin )
  {
    auto response = _controller->read_program( token, make_input( std::move( stdin ) ) );
    EXPECT_TRUE( response.has_value() );
    if( !response )
      return 0;

    auto value = program::decode_integer< std::uint64_t >( response->stdout );
    EXPECT_TRUE( value.has_value() );
    return value.value_or( 0 );
  }

  bool read_bool( const protocol::transaction_receipt& receipt )
  {
    EXPECT_FALSE( receipt.frames.empty() );
    if( receipt.frames.empty() )
      return false;

    auto value = program::decode_bool( receipt.frames.back()->stdout );
    return value.value_or( false );
  }

  protocol::account token;
};

TEST_F( integration, token )
{
  auto response = _controller->read_program( token, make_input( make_stdin( program::token::instruction::name ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( memory::as_string_view( response->stdout ), "Token" );

  response = _controller->read_program( token, make_input( make_stdin( program::token::instruction::symbol ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( memory::as_string_view( response->stdout ), "TOKEN" );

  response = _controller->read_program( token, make_input( make_stdin( program::token::instruction::decimals ) ) );
  ASSERT_TRUE( response.has_value() );
  EXPECT_EQ( program::decode_integer< std::uint32_t >( response->stdout ).value(), 8 );

  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::mint, alice, 100ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::total_supply ) ), 100 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, alice ) ), 100 );

  // The supply is issued once
  auto receipt =
    submit( alice, make_call_operation( token, make_stdin( program::token::instruction::mint, bob, 100ull ) ) );
  ASSERT_TRUE( receipt.has_value() );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->code, std::to_underlying( program::program_errc::supply_already_issued ) );

  receipt =
    submit( alice, make_call_operation( token, make_stdin( program::token::instruction::transfer, bob, 60ull ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::without_reversion ) );
  EXPECT_TRUE( read_bool( *receipt ) );
  ASSERT_EQ( receipt->events.size(), 1 );
  EXPECT_EQ( receipt->events[ 0 ].name, "token.transfer" );
  EXPECT_EQ( receipt->events[ 0 ].source, token );

  auto event = protocol::from_binary< program::token::transfer_event >( receipt->events[ 0 ].data );
  EXPECT_EQ( event.from, alice );
  EXPECT_EQ( event.to, bob );
  EXPECT_EQ( event.value, 60 );

  // Insufficient funds are reported, not reverted
  receipt =
    submit( alice, make_call_operation( token, make_stdin( program::token::instruction::transfer, bob, 41ull ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::without_reversion ) );
  EXPECT_FALSE( read_bool( *receipt ) );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, alice ) ), 40 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, bob ) ), 60 );

  receipt = submit( alice,
                    make_call_operation( token, make_stdin( program::token::instruction::transfer, protocol::account{}, 1ull ) ) );
  ASSERT_TRUE( receipt.has_value() );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->code, std::to_underlying( program::program_errc::zero_address ) );

  response = _controller->read_program( token, make_input( make_stdin( std::numeric_limits< std::uint32_t >::max() ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), program::program_errc::invalid_instruction );
}

TEST_F( integration, token_issuance )
{
  // Only the deploying account issues the supply
  auto receipt =
    submit( bob, make_call_operation( token, make_stdin( program::token::instruction::mint, bob, 100ull ) ) );
  ASSERT_TRUE( receipt.has_value() );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->code, std::to_underlying( program::program_errc::unauthorized ) );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::total_supply ) ), 0 );

  // An empty issuance still closes minting
  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::mint, alice, 0ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  receipt =
    submit( alice, make_call_operation( token, make_stdin( program::token::instruction::mint, alice, 100ull ) ) );
  ASSERT_TRUE( receipt.has_value() );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->code, std::to_underlying( program::program_errc::supply_already_issued ) );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::total_supply ) ), 0 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, alice ) ), 0 );
}

TEST_F( integration, token_allowance )
{
  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::mint, alice, 100ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::approve, bob, 30ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::allowance, alice, bob ) ), 30 );

  auto receipt =
    submit( bob,
            make_call_operation( token, make_stdin( program::token::instruction::transfer_from, alice, carol, 31ull ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::without_reversion ) );
  EXPECT_FALSE( read_bool( *receipt ) );

  receipt =
    submit( bob,
            make_call_operation( token, make_stdin( program::token::instruction::transfer_from, alice, carol, 20ull ) ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::without_reversion ) );
  EXPECT_TRUE( read_bool( *receipt ) );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::allowance, alice, bob ) ), 10 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, alice ) ), 80 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, carol ) ), 20 );
}

TEST_F( integration, coin_transfer )
{
  ASSERT_TRUE( verify( submit( alice, make_transfer_operation( treasury, 250 ) ),
                       test::fixture::verification::without_reversion ) );

  EXPECT_EQ( _controller->balance_of( alice ), test::initial_coin_balance - 250 );
  EXPECT_EQ( _controller->balance_of( treasury ), 250 );
  EXPECT_EQ( _controller->account_nonce( alice ), 1 );

  auto receipt = submit( treasury, make_transfer_operation( alice, 251 ) );
  ASSERT_TRUE( receipt.has_value() );
  EXPECT_TRUE( receipt->reverted );
  EXPECT_EQ( receipt->code, std::to_underlying( controller::reversion_errc::insufficient_balance ) );

  // A reverted transaction still consumes its nonce
  EXPECT_EQ( _controller->account_nonce( treasury ), 1 );
  EXPECT_EQ( _controller->balance_of( treasury ), 250 );
}

TEST_F( integration, reverted_transaction_discards_state )
{
  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::mint, alice, 100ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  // The transfer applies, then the unknown program reverts the whole transaction
  auto transaction =
    make_transaction( alice,
                      make_call_operation( token, make_stdin( program::token::instruction::transfer, bob, 50ull ) ),
                      make_transfer_operation( bob, 10 ),
                      make_call_operation( protocol::program_account( "missing" ), {} ) );

  auto receipt = _controller->process( make_block( transaction ) );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::head ) );
  ASSERT_EQ( receipt->transaction_receipts.size(), 1 );

  const auto& transaction_receipt = receipt->transaction_receipts[ 0 ];
  EXPECT_TRUE( transaction_receipt.reverted );
  EXPECT_EQ( transaction_receipt.code, std::to_underlying( controller::reversion_errc::invalid_program ) );
  EXPECT_TRUE( transaction_receipt.events.empty() );
  EXPECT_FALSE( transaction_receipt.logs.empty() );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, alice ) ), 100 );
  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::balance_of, bob ) ), 0 );
  EXPECT_EQ( _controller->balance_of( bob ), test::initial_coin_balance );
  EXPECT_EQ( _controller->account_nonce( alice ), 2 );
}

TEST_F( integration, block_validation )
{
  auto head = _controller->head();
  EXPECT_EQ( head.height, 0 );

  auto transaction = make_transaction( alice, make_transfer_operation( bob, 1 ) );

  auto block = make_block( head.height + 2, head.time + 1, head.id, transaction );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::unexpected_height );

  block = make_block( head.height + 1, head.time + 1, setmint::crypto::hash( "elsewhere" ), transaction );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::unknown_previous_block );

  auto far_future = std::chrono::system_clock::now() + std::chrono::hours( 1 );
  block = make_block( head.height + 1,
                      std::chrono::duration_cast< std::chrono::milliseconds >( far_future.time_since_epoch() ).count(),
                      head.id,
                      transaction );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::timestamp_out_of_bounds );

  block    = make_block( transaction );
  block.id = setmint::crypto::hash( "tampered" );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::malformed_block );

  block = make_block( make_transaction( alice, 2, make_transfer_operation( bob, 1 ) ) );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::invalid_nonce );

  EXPECT_EQ( _controller->head().height, 0 );

  block = make_block( transaction );
  ASSERT_TRUE( verify( _controller->process( block ),
                       test::fixture::verification::head | test::fixture::verification::without_reversion ) );

  head = _controller->head();
  EXPECT_EQ( head.height, 1 );
  EXPECT_EQ( head.id, block.id );
  EXPECT_EQ( head.time, block.timestamp );

  // Timestamps must increase
  block = make_block( head.height + 1, head.time, head.id, make_transaction( alice, make_transfer_operation( bob, 1 ) ) );
  EXPECT_EQ( _controller->process( block ).error(), controller::controller_errc::timestamp_out_of_bounds );
}

TEST_F( integration, pending_transaction )
{
  auto transaction = make_transaction( alice, make_transfer_operation( bob, 10 ) );

  auto receipt = _controller->process( transaction );
  ASSERT_TRUE( verify( receipt, test::fixture::verification::without_reversion ) );
  EXPECT_EQ( receipt->id, transaction.id );
  EXPECT_EQ( receipt->signer, alice );

  // Nothing is committed
  EXPECT_EQ( _controller->balance_of( bob ), test::initial_coin_balance );
  EXPECT_EQ( _controller->account_nonce( alice ), 0 );

  transaction.nonce = 7;
  EXPECT_EQ( _controller->process( transaction ).error(), controller::controller_errc::malformed_transaction );

  transaction.id = protocol::make_id( transaction );
  EXPECT_EQ( _controller->process( transaction ).error(), controller::controller_errc::invalid_nonce );

  auto from_program = make_transaction( token, make_transfer_operation( bob, 10 ) );
  EXPECT_EQ( _controller->process( from_program ).error(), controller::controller_errc::malformed_transaction );
}

TEST_F( integration, read_only )
{
  ASSERT_TRUE( verify( submit( alice,
                               make_call_operation( token,
                                                    make_stdin( program::token::instruction::mint, alice, 100ull ) ) ),
                       test::fixture::verification::without_reversion ) );

  auto response =
    _controller->read_program( token, make_input( make_stdin( program::token::instruction::approve, bob, 1ull ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), controller::reversion_errc::read_only_context );

  response = _controller->read_program( alice, make_input( make_stdin( program::token::instruction::name ) ) );
  ASSERT_FALSE( response.has_value() );
  EXPECT_EQ( response.error(), controller::reversion_errc::invalid_program );

  EXPECT_EQ( read_integer( make_stdin( program::token::instruction::allowance, alice, bob ) ), 0 );
}

// NOLINTEND
