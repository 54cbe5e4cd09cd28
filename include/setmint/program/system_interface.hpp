#pragma once

#include <setmint/crypto.hpp>
#include <setmint/program/error.hpp>
#include <setmint/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace setmint::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * The host services available to a running program.
 *
 * Objects live in per-program object spaces selected by id. Spans returned
 * by get_object are valid until the next write.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;

  /**
   * Fills the buffer from the file descriptor, failing if fewer bytes remain.
   */
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer ) = 0;

  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual void log( std::string_view message )                                          = 0;
  virtual std::error_code event( std::string_view name,
                                 std::span< const std::byte > data,
                                 const std::vector< protocol::account >& impacted ) = 0;

  /**
   * The account that invoked the running program. For a top level call this
   * is the transaction signer.
   */
  virtual const protocol::account& get_caller() = 0;
  virtual const protocol::account& get_self()   = 0;

  /**
   * Native coin attached to the running call. It has already been credited
   * to the running program.
   */
  virtual std::uint64_t get_value() = 0;

  virtual std::uint64_t get_balance( const protocol::account& account ) = 0;

  /**
   * Moves native coin from the running program to another account.
   */
  virtual std::error_code transfer_value( const protocol::account& to, std::uint64_t value ) = 0;

  /**
   * Per block unpredictable value. Influenced by block producers.
   */
  virtual crypto::digest get_entropy() = 0;

  /**
   * Runs another program with the running program as its caller. The call
   * commits only if it succeeds.
   */
  virtual result< protocol::program_output > call_program( const protocol::account& account,
                                                           std::span< const std::byte > stdin,
                                                           std::uint64_t value                      = 0,
                                                           std::span< const std::string > arguments = {} ) = 0;
};

} // namespace setmint::program
