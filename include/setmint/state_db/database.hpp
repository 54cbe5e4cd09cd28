#pragma once

#include <setmint/state_db/state_node.hpp>

#include <memory>

namespace setmint::state_db {

/**
 * database holds the committed state of a single chain.
 *
 * Work in progress lives in temporary state nodes created from the head.
 * A temporary node is either squashed into its parent or dropped, which
 * discards everything written to it.
 *
 * database is not thread safe. Writes to a state node and its children
 * must be serialized by the caller.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, writing the initial state with init.
   */
  void open( genesis_init_function init );

  /**
   * Close the database.
   */
  void close();

  /**
   * Discard all state and rerun the initial state function.
   */
  void reset();

  bool is_open() const noexcept;

  /**
   * Get and return the current "head" node.
   */
  permanent_state_node_ptr head() const;

private:
  std::shared_ptr< state_delta > _root;
  genesis_init_function _init;
};

} // namespace setmint::state_db
