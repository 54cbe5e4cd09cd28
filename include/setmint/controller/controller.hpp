#pragma once

#include <setmint/controller/error.hpp>
#include <setmint/controller/execution_context.hpp>
#include <setmint/controller/state.hpp>
#include <setmint/program/program.hpp>
#include <setmint/protocol.hpp>
#include <setmint/state_db.hpp>

#include <chrono>
#include <memory>

namespace setmint::controller {

/**
 * Applies blocks to a single chain of state.
 *
 * Programs are native objects registered by account before any block that
 * calls them is processed.
 */
class controller
{
public:
  controller();
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open( const state::genesis_data& data );
  void close();

  void register_program( const protocol::account& id, std::shared_ptr< program::program > p );

  result< protocol::block_receipt >
  process( const protocol::block& block,
           std::chrono::system_clock::time_point now = std::chrono::system_clock::now() );

  /**
   * Applies a transaction on top of head without committing it.
   */
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  state::head head() const;

  result< protocol::program_output > read_program( const protocol::account& account,
                                                   const protocol::program_input& input = {} ) const;

  std::uint64_t account_nonce( const protocol::account& account ) const;
  std::uint64_t balance_of( const protocol::account& account ) const;

private:
  state_db::database _db;
  program_registry _registry;
};

} // namespace setmint::controller
