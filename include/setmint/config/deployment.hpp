#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include <setmint/program/minter.hpp>
#include <setmint/protocol/account.hpp>

namespace setmint::config {

/**
 * Parses an account written as 0x-prefixed hex, "user:<seed>" or
 * "program:<name>".
 *
 * Throws std::invalid_argument on malformed input.
 */
protocol::account parse_account( const std::string& text );

/**
 * Reads a deployment bundle from a YAML map.
 *
 * name, symbol, owner, fee-address, payment-token, base-uri and max-supply
 * are required. coin-fee, token-fee, contract-uri and royalty-numerator
 * default to zero or empty.
 */
program::deployment_bundle parse_deployment( const YAML::Node& node );

} // namespace setmint::config
