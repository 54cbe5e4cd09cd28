#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace setmint::state_db::backends {

using key_type   = std::vector< std::byte >;
using value_type = std::vector< std::byte >;

/**
 * Object storage behind a single state delta. Keys already carry their
 * object space prefix.
 */
class abstract_backend
{
public:
  virtual ~abstract_backend() = default;

  virtual void put( key_type&& key, value_type&& value )                                  = 0;
  virtual std::optional< std::span< const std::byte > > get( const key_type& key ) const = 0;
  virtual void remove( const key_type& key )                                              = 0;
  virtual void clear()                                                                    = 0;

  /**
   * Removes and returns the object with the lowest key, if any.
   */
  virtual std::optional< std::pair< key_type, value_type > > extract_front() = 0;
};

} // namespace setmint::state_db::backends
