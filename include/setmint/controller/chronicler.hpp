#pragma once

#include <setmint/protocol.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace setmint::controller {

/**
 * Records what happens while a context runs: events, logs and program
 * frames, in order.
 *
 * A checkpoint marks the current position. Rolling back to it drops the
 * events recorded since, logs and frames are kept so a failed call can still
 * be diagnosed.
 */
class chronicler final
{
public:
  struct checkpoint
  {
    std::size_t events = 0;
    std::size_t logs   = 0;
    std::size_t frames = 0;
  };

  void push_event( protocol::event&& e );
  void push_log( std::string_view message );
  void add_frame( const std::shared_ptr< protocol::program_frame >& frame );

  checkpoint mark() const noexcept;
  void rollback( const checkpoint& c ) noexcept;

  std::vector< protocol::event > events( const checkpoint& since = checkpoint{ 0, 0, 0 } ) const;
  std::vector< std::string > logs( const checkpoint& since = checkpoint{ 0, 0, 0 } ) const;
  std::vector< std::shared_ptr< protocol::program_frame > > frames( const checkpoint& since = checkpoint{ 0, 0, 0 } ) const;

private:
  std::vector< protocol::event > _events;
  std::vector< std::string > _logs;
  std::vector< std::shared_ptr< protocol::program_frame > > _frames;
};

} // namespace setmint::controller
