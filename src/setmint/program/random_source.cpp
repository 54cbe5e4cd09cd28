#include <setmint/memory.hpp>
#include <setmint/program/random_source.hpp>

namespace setmint::program {

std::uint64_t chain_random_source::next( system_interface* system, std::uint64_t token_id )
{
  auto digest = crypto::hash_all( system->get_entropy(), system->get_caller(), token_id );
  return memory::from_little_endian< std::uint64_t >( digest );
}

} // namespace setmint::program
