#pragma once

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <stdexcept>
#include <vector>

#include <setmint/state_db/backends/backend.hpp>
#include <setmint/state_db/error.hpp>
#include <setmint/state_db/types.hpp>

namespace setmint::state_db {

/**
 * A set of writes and removals layered on top of a parent delta. Reads fall
 * through to the parent unless the key was written or removed here. The
 * delta without a parent is the root and holds the committed state.
 */
class state_delta final: public std::enable_shared_from_this< state_delta >
{
private:
  std::shared_ptr< state_delta > _parent;
  std::shared_ptr< backends::abstract_backend > _backend;
  std::set< std::vector< std::byte > > _removed_objects;
  state_node_id _id{};
  std::uint64_t _revision = 0;
  bool _squashed          = false;

public:
  state_delta() noexcept;
  state_delta( const std::shared_ptr< state_delta >& parent ) noexcept;

  state_delta& operator=( const state_delta& ) = delete;
  state_delta& operator=( state_delta&& )      = delete;
  state_delta( const state_delta& )            = delete;
  state_delta( state_delta&& )                 = delete;

  ~state_delta() = default;

  template< std::ranges::range ValueType >
  std::int64_t put( std::vector< std::byte >&& key, const ValueType& value );
  std::int64_t remove( std::vector< std::byte >&& key );
  std::optional< std::span< const std::byte > > get( const std::vector< std::byte >& key ) const;

  /**
   * Merges this delta into its parent and empties it.
   */
  void squash();
  void clear();

  bool removed( const std::vector< std::byte >& key ) const;
  bool root() const;
  bool squashed() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t revision );

  const state_node_id& id() const;
  void set_id( const state_node_id& id );

  const std::shared_ptr< state_delta >& parent() const;

  std::shared_ptr< state_delta > make_child();

private:
  void check_writable() const;
};

template< std::ranges::range ValueType >
std::int64_t state_delta::put( std::vector< std::byte >&& key, const ValueType& value )
{
  check_writable();

  std::int64_t size = std::ssize( key ) + std::ssize( value );
  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );

  _removed_objects.erase( key );
  _backend->put( std::move( key ), std::vector< std::byte >( std::ranges::begin( value ), std::ranges::end( value ) ) );

  return size;
}

} // namespace setmint::state_db
