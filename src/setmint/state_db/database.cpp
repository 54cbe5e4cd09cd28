#include <setmint/state_db/database.hpp>

#include <system_error>

namespace setmint::state_db {

database::database() noexcept {}

database::~database()
{
  close();
}

void database::open( genesis_init_function init )
{
  if( _root )
    throw std::system_error( state_db_errc::already_open );

  _init = std::move( init );
  reset();
}

void database::close()
{
  _root.reset();
}

void database::reset()
{
  _root = std::make_shared< state_delta >();

  state_node_ptr root = std::make_shared< permanent_state_node >( _root );
  if( _init )
    _init( root );
}

bool database::is_open() const noexcept
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::head() const
{
  if( !_root )
    throw std::system_error( state_db_errc::not_open );

  return std::make_shared< permanent_state_node >( _root );
}

} // namespace setmint::state_db
