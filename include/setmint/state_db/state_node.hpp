#pragma once

#include <setmint/state_db/state_delta.hpp>
#include <setmint/state_db/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace setmint::state_db {

/**
 * A view of one state delta addressed by object space and key.
 */
class state_node
{
public:
  state_node( const state_node& ) = delete;
  state_node( state_node&& )      = delete;

  state_node& operator=( const state_node& ) = delete;
  state_node& operator=( state_node&& )      = delete;

  std::optional< std::span< const std::byte > > get( const object_space& space,
                                                     std::span< const std::byte > key ) const;
  std::int64_t put( const object_space& space, std::span< const std::byte > key, std::span< const std::byte > value );
  std::int64_t remove( const object_space& space, std::span< const std::byte > key );

  temporary_state_node_ptr make_child();

  const state_node_id& id() const;
  std::uint64_t revision() const;

protected:
  explicit state_node( std::shared_ptr< state_delta > delta ) noexcept;
  ~state_node() = default;

  // Throws already_squashed once the delta has been handed to the parent
  state_delta& current() const;

  std::shared_ptr< state_delta > _delta;
};

class permanent_state_node final: public state_node
{
public:
  explicit permanent_state_node( std::shared_ptr< state_delta > delta ) noexcept;

  /**
   * Squashes a direct child into the committed state and stamps it with the
   * block id and height. Any other node is rejected with not_a_child.
   */
  void commit( temporary_state_node& child, const state_node_id& id, std::uint64_t revision );
};

class temporary_state_node final: public state_node
{
public:
  explicit temporary_state_node( std::shared_ptr< state_delta > delta ) noexcept;

  /**
   * Merges the writes into the parent. The node is unusable afterwards.
   */
  void squash();

private:
  friend class permanent_state_node;
};

} // namespace setmint::state_db
