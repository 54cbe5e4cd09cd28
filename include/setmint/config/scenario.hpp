#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <setmint/program/minter.hpp>
#include <setmint/protocol/account.hpp>

namespace setmint::config {

struct token_parameters
{
  std::string name;
  std::string symbol;
  std::uint32_t decimals = 8;
  std::uint64_t supply   = 0;
  protocol::account holder{};
};

struct allocation
{
  protocol::account account{};
  std::uint64_t balance = 0;
};

enum class action_type : std::uint8_t
{
  approve,
  mint,
  pause,
  start_set,
  set_base_uri,
  set_coin_fee,
  set_token_fee,
  set_batch_limit,
  withdraw_coin,
  withdraw_tokens,
  transfer,
  burn
};

/**
 * One scripted call. Only the fields the action type uses are read.
 */
struct action
{
  action_type type = action_type::mint;
  protocol::account signer{};
  protocol::account target{};
  std::uint64_t amount     = 0;
  std::uint64_t value      = 0;
  std::uint64_t set        = 0;
  std::uint64_t max_supply = 0;
  std::uint64_t counter    = 0;
  std::uint64_t token_id   = 0;
  std::string uri;
  bool flag = false;
};

struct scenario
{
  protocol::account minter{};
  program::deployment_bundle deployment;
  token_parameters payment_token;
  std::vector< allocation > genesis;
  std::vector< action > script;
};

action_type parse_action_type( const std::string& name );

/**
 * Reads a sale scenario. The document holds a deployment map, an optional
 * payment-token map, an optional genesis list of coin balances and a script
 * of actions run in order.
 */
scenario parse_scenario( const YAML::Node& root );

} // namespace setmint::config
