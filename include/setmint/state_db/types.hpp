#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include <setmint/protocol/account.hpp>

namespace setmint::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

constexpr std::size_t object_space_padding_size = 3;
constexpr std::size_t state_node_id_size        = 32;

/**
 * Prefix of every key in the database. The address is the owning program,
 * or null for system spaces.
 */
struct object_space
{
  bool system = false;
  std::array< std::uint8_t, object_space_padding_size > padding{};
  std::array< std::byte, protocol::account_length > address{};
  std::uint32_t id = 0;
};

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;
using state_node_id            = std::array< std::byte, state_node_id_size >;
using genesis_init_function    = std::function< void( state_node_ptr& ) >;

constexpr state_node_id null_id = {};

} // namespace setmint::state_db
