#pragma once

#include <map>

#include <setmint/state_db/backends/backend.hpp>

namespace setmint::state_db::backends::map {

class map_backend final: public abstract_backend
{
public:
  void put( key_type&& key, value_type&& value ) override;
  std::optional< std::span< const std::byte > > get( const key_type& key ) const override;
  void remove( const key_type& key ) override;
  void clear() override;

  std::optional< std::pair< key_type, value_type > > extract_front() override;

private:
  std::map< key_type, value_type > _objects;
};

} // namespace setmint::state_db::backends::map
