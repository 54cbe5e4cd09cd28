#include <setmint/controller/chronicler.hpp>

#include <algorithm>

namespace setmint::controller {

void chronicler::push_event( protocol::event&& e )
{
  e.sequence = static_cast< std::uint32_t >( _events.size() );
  _events.emplace_back( std::move( e ) );
}

void chronicler::push_log( std::string_view message )
{
  _logs.emplace_back( message );
}

void chronicler::add_frame( const std::shared_ptr< protocol::program_frame >& frame )
{
  _frames.push_back( frame );
}

chronicler::checkpoint chronicler::mark() const noexcept
{
  return checkpoint{ .events = _events.size(), .logs = _logs.size(), .frames = _frames.size() };
}

void chronicler::rollback( const checkpoint& c ) noexcept
{
  if( c.events < _events.size() )
    _events.erase( _events.begin() + static_cast< std::ptrdiff_t >( c.events ), _events.end() );
}

template< typename T >
static std::vector< T > tail( const std::vector< T >& v, std::size_t since )
{
  if( since >= v.size() )
    return {};

  return std::vector< T >( v.begin() + static_cast< std::ptrdiff_t >( since ), v.end() );
}

std::vector< protocol::event > chronicler::events( const checkpoint& since ) const
{
  return tail( _events, since.events );
}

std::vector< std::string > chronicler::logs( const checkpoint& since ) const
{
  return tail( _logs, since.logs );
}

std::vector< std::shared_ptr< protocol::program_frame > > chronicler::frames( const checkpoint& since ) const
{
  return tail( _frames, since.frames );
}

} // namespace setmint::controller
