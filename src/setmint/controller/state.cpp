#include <setmint/controller/state.hpp>
#include <setmint/memory.hpp>

#include <utility>

namespace setmint::controller::state {
namespace space {

enum class system_space_id : std::uint8_t
{
  metadata          = 0,
  account_balance   = 1,
  transaction_nonce = 2
};

const state_db::object_space& metadata()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::metadata ) };
  return s;
}

const state_db::object_space& account_balance()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::account_balance ) };
  return s;
}

const state_db::object_space& transaction_nonce()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::transaction_nonce ) };
  return s;
}

} // namespace space

namespace key {

std::span< const std::byte > head()
{
  static auto h = crypto::hash( "object_key::head" );
  return h;
}

} // namespace key

genesis_entry genesis_balance( const protocol::account& account, std::uint64_t amount )
{
  auto value = memory::to_little_endian( amount );
  return genesis_entry{ .space = space::account_balance(),
                        .key   = std::vector< std::byte >( account.begin(), account.end() ),
                        .value = std::vector< std::byte >( value.begin(), value.end() ) };
}

} // namespace setmint::controller::state
