#pragma once

#include <cstdint>
#include <string>

#include <setmint/program/error.hpp>
#include <setmint/program/program.hpp>

namespace setmint::program {

/**
 * A fungible token with allowances. The whole supply is issued by a single
 * call to mint, which only the deploying account may make. transfer and transfer_from report insufficient funds as a
 * false result rather than failing.
 */
struct token final: public program
{
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    name,
    symbol,
    decimals,
    total_supply,
    balance_of,
    transfer,
    approve,
    allowance,
    transfer_from,
    mint
  };

  struct transfer_event
  {
    protocol::account from{};
    protocol::account to{};
    std::uint64_t value = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & from;
      ar & to;
      ar & value;
    }
  };

  struct approval_event
  {
    protocol::account owner{};
    protocol::account spender{};
    std::uint64_t value = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & owner;
      ar & spender;
      ar & value;
    }
  };

  token( const protocol::account& deployer, std::string name, std::string symbol, std::uint32_t decimals = 8 );
  token( const token& ) = delete;
  token( token&& )      = delete;
  ~token() override     = default;

  token& operator=( const token& ) = delete;
  token& operator=( token&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  result< std::uint64_t > total_supply( system_interface* system );
  result< std::uint64_t > balance_of( system_interface* system, const protocol::account& account );
  result< std::uint64_t >
  allowance( system_interface* system, const protocol::account& owner, const protocol::account& spender );

  result< bool >
  move( system_interface* system, const protocol::account& from, const protocol::account& to, std::uint64_t value );

  protocol::account _deployer;
  std::string _name;
  std::string _symbol;
  std::uint32_t _decimals;
};

} // namespace setmint::program
