#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <setmint/crypto.hpp>
#include <setmint/protocol.hpp>
#include <setmint/state_db.hpp>

namespace setmint::controller { namespace state {

namespace space {

const state_db::object_space& metadata();
const state_db::object_space& account_balance();
const state_db::object_space& transaction_nonce();

} // namespace space

namespace key {

std::span< const std::byte > head();

} // namespace key

struct genesis_entry
{
  state_db::object_space space;
  std::vector< std::byte > key;
  std::vector< std::byte > value;
};

using genesis_data = std::vector< genesis_entry >;

/**
 * Credits native coin to an account in the initial state.
 */
genesis_entry genesis_balance( const protocol::account& account, std::uint64_t amount );

struct head
{
  crypto::digest id{};
  std::uint64_t height = 0;
  crypto::digest previous{};
  std::uint64_t time = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar& boost::serialization::make_array( id.data(), id.size() );
    ar & height;
    ar& boost::serialization::make_array( previous.data(), previous.size() );
    ar & time;
  }
};

}} // namespace setmint::controller::state
