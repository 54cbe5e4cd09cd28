#pragma once

#include <setmint/controller/call_stack.hpp>
#include <setmint/controller/chronicler.hpp>
#include <setmint/controller/error.hpp>
#include <setmint/controller/state.hpp>
#include <setmint/crypto.hpp>
#include <setmint/program/program.hpp>
#include <setmint/program/system_interface.hpp>
#include <setmint/state_db.hpp>

#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace setmint::controller {

using program_registry = std::map< protocol::account, std::shared_ptr< program::program > >;

enum class intent : std::uint8_t
{
  read_only,
  block_application,
  transaction_application
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const program_registry& registry, intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );

  void set_entropy( const crypto::digest& entropy ) noexcept;

  class chronicler& chronicler();

  result< protocol::block_receipt > apply( const protocol::block& );
  result< protocol::transaction_receipt > apply( const protocol::transaction& );

  /**
   * Runs a program outside of any transaction. Nothing it writes is kept.
   */
  result< protocol::program_output > read_program( const protocol::account& id, const protocol::program_input& input );

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  void log( std::string_view message ) final;
  std::error_code event( std::string_view name,
                         std::span< const std::byte > data,
                         const std::vector< protocol::account >& impacted ) final;

  const protocol::account& get_caller() final;
  const protocol::account& get_self() final;
  std::uint64_t get_value() final;
  std::uint64_t get_balance( const protocol::account& account ) final;
  std::error_code transfer_value( const protocol::account& to, std::uint64_t value ) final;
  crypto::digest get_entropy() final;

  result< protocol::program_output > call_program( const protocol::account& account,
                                                   std::span< const std::byte > stdin,
                                                   std::uint64_t value                      = 0,
                                                   std::span< const std::string > arguments = {} ) final;

  std::uint64_t account_nonce( const protocol::account& ) const;
  std::uint64_t account_balance( const protocol::account& ) const;
  state::head head() const;

private:
  std::error_code apply( const protocol::call_program& );
  std::error_code apply( const protocol::transfer& );

  std::error_code set_account_nonce( const protocol::account& account, std::uint64_t nonce );
  std::error_code move_value( const protocol::account& from, const protocol::account& to, std::uint64_t value );

  result< protocol::program_output > run_program( const protocol::account& caller,
                                                  const protocol::account& id,
                                                  std::span< const std::byte > stdin,
                                                  std::uint64_t value,
                                                  std::span< const std::string > arguments );

  state_db::object_space create_object_space( std::uint32_t id );

  const program_registry& _registry;
  state_db::state_node_ptr _state_node;
  call_stack _stack;

  const protocol::transaction* _transaction = nullptr;

  class chronicler _chronicler;
  crypto::digest _entropy{};
  intent _intent;
};

} // namespace setmint::controller
