#include <setmint/protocol/operation.hpp>

namespace setmint::protocol {

std::size_t call_program::size() const noexcept
{
  std::size_t bytes = 0;

  bytes += id.size();
  bytes += sizeof( value );

  for( const auto& argument: input.arguments )
    bytes += argument.size();

  bytes += input.stdin.size();

  return bytes;
}

bool call_program::validate() const noexcept
{
  return id.program();
}

std::size_t transfer::size() const noexcept
{
  return to.size() + sizeof( value );
}

bool transfer::validate() const noexcept
{
  return !to.null() && value > 0;
}

} // namespace setmint::protocol
