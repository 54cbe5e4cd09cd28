#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <setmint/protocol/account.hpp>

namespace setmint::controller {

/**
 * The live state of one program invocation. Input is borrowed from the
 * caller, output accumulates until the invocation returns.
 */
struct stack_frame final
{
  protocol::account program_id{};
  protocol::account caller{};
  std::uint64_t value = 0;
  std::span< const std::string > arguments;
  std::span< const std::byte > stdin;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;

  std::size_t input_offset = 0;
};

class call_stack final
{
public:
  static constexpr std::size_t default_depth_limit = 32;

  call_stack( std::size_t depth_limit = default_depth_limit );

  std::error_code push( stack_frame&& frame );
  void pop();

  stack_frame& current();
  std::size_t depth() const noexcept;

private:
  std::vector< stack_frame > _frames;
  std::size_t _depth_limit;
};

/**
 * Pops the frame pushed just before the guard was created.
 */
struct frame_guard final
{
  frame_guard( const frame_guard& )            = delete;
  frame_guard( frame_guard&& )                 = delete;
  frame_guard& operator=( const frame_guard& ) = delete;
  frame_guard& operator=( frame_guard&& )      = delete;

  frame_guard( call_stack& stack ):
      _stack( stack )
  {}

  ~frame_guard()
  {
    _stack.pop();
  }

private:
  call_stack& _stack;
};

} // namespace setmint::controller
