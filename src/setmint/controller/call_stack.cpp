#include <setmint/controller/call_stack.hpp>
#include <setmint/controller/error.hpp>

#include <stdexcept>

namespace setmint::controller {

call_stack::call_stack( std::size_t depth_limit ):
    _depth_limit( depth_limit )
{
  // References to the current frame must survive nested calls
  _frames.reserve( depth_limit );
}

std::error_code call_stack::push( stack_frame&& frame )
{
  if( _frames.size() >= _depth_limit )
    return reversion_errc::stack_overflow;

  _frames.push_back( std::move( frame ) );
  return reversion_errc::ok;
}

void call_stack::pop()
{
  if( _frames.empty() )
    throw std::logic_error( "pop from an empty call stack" );

  _frames.pop_back();
}

stack_frame& call_stack::current()
{
  if( _frames.empty() )
    throw std::logic_error( "no program is executing" );

  return _frames.back();
}

std::size_t call_stack::depth() const noexcept
{
  return _frames.size();
}

} // namespace setmint::controller
