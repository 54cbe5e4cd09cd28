#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <setmint/controller/controller.hpp>
#include <setmint/crypto.hpp>
#include <setmint/memory.hpp>
#include <setmint/program/io.hpp>
#include <setmint/protocol.hpp>

#include <test/programs.hpp>

namespace test {

constexpr std::uint64_t initial_coin_balance = 1'000'000'000;

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& log_level );
  ~fixture();

  setmint::protocol::operation
  make_call_operation( const setmint::protocol::account& id, std::vector< std::byte >&& stdin, std::uint64_t value = 0 );
  setmint::protocol::operation make_transfer_operation( const setmint::protocol::account& to, std::uint64_t value );

  template< Operation... Args >
  setmint::protocol::transaction
  make_transaction( const setmint::protocol::account& signer, std::uint64_t nonce, Args... args )
  {
    setmint::protocol::transaction t;
    ( ( t.operations.emplace_back( std::forward< Args >( args ) ) ), ... );
    t.signer = signer;
    t.nonce  = nonce;
    t.id     = setmint::protocol::make_id( t );
    return t;
  }

  template< Operation... Args >
  setmint::protocol::transaction make_transaction( const setmint::protocol::account& signer, Args... args )
  {
    return make_transaction( signer, _controller->account_nonce( signer ) + 1, std::forward< Args >( args )... );
  }

  template< Transaction... Args >
  setmint::protocol::block make_block( Args... args )
  {
    auto head = _controller->head();
    auto now =
      std::chrono::duration_cast< std::chrono::milliseconds >( std::chrono::system_clock::now().time_since_epoch() )
        .count();
    std::uint64_t timestamp = head.time >= std::uint64_t( now ) ? head.time + 1 : now;
    return make_block( head.height + 1, timestamp, head.id, std::forward< Args >( args )... );
  }

  template< Transaction... Args >
  setmint::protocol::block make_block( std::uint64_t height,
                                       std::uint64_t timestamp,
                                       const setmint::crypto::digest& previous,
                                       Args... args )
  {
    setmint::protocol::block b;
    ( ( b.transactions.emplace_back( std::forward< Args >( args ) ) ), ... );
    b.timestamp = timestamp;
    b.height    = height;
    b.previous  = previous;
    b.id        = setmint::protocol::make_id( b );
    return b;
  }

  /**
   * Wraps one operation in a transaction and a block and processes them.
   */
  setmint::controller::result< setmint::protocol::transaction_receipt >
  submit( const setmint::protocol::account& signer, setmint::protocol::operation op );

  template< typename... Args >
  std::vector< std::byte > make_stdin( const Args&... args ) const
  {
    return setmint::program::make_stdin( args... );
  }

  setmint::protocol::program_input make_input( std::vector< std::byte >&& stdin,
                                               std::vector< std::string >&& arguments = {} ) const noexcept;

  enum verification : std::uint_fast8_t
  {
    none              = 0,
    processed         = 1 << 0,
    head              = 1 << 1,
    without_reversion = 1 << 2
  };

  bool verify( setmint::controller::result< setmint::protocol::block_receipt > receipt, std::uint64_t flags ) const;
  bool verify( setmint::controller::result< setmint::protocol::transaction_receipt > receipt,
               std::uint64_t flags ) const;

  std::unique_ptr< setmint::controller::controller > _controller;
  setmint::controller::state::genesis_data _genesis_data;

  const setmint::protocol::account alice    = setmint::protocol::user_account( "alice" );
  const setmint::protocol::account bob      = setmint::protocol::user_account( "bob" );
  const setmint::protocol::account carol    = setmint::protocol::user_account( "carol" );
  const setmint::protocol::account treasury = setmint::protocol::user_account( "treasury" );
};

} // namespace test
