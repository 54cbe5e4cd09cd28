#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <setmint/program/system_interface.hpp>

namespace setmint::program {

/**
 * The not yet assigned display numbers of the active set, stored sparsely.
 *
 * Slot i holds i unless an object parks a different number there. Drawing
 * returns the number at a random slot, moves the number at the last slot
 * into its place and shrinks the pool by one, so every number in
 * [0, size) is handed out exactly once.
 *
 * The pool header (generation and size) lives under the empty key. Slot keys
 * are the big-endian generation followed by the big-endian slot index, so a
 * reset only bumps the generation and never visits old slots.
 */
class display_pool final
{
public:
  struct header
  {
    std::uint64_t generation = 0;
    std::uint64_t size       = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & generation;
      ar & size;
    }
  };

  display_pool( system_interface* system, std::uint32_t space_id ) noexcept;

  result< std::uint64_t > size() const;

  /**
   * Abandons every remaining number and refills the pool with [0, size).
   */
  std::error_code reset( std::uint64_t size );

  result< std::uint64_t > draw( std::uint64_t random );

private:
  using slot_key = std::array< std::byte, 2 * sizeof( std::uint64_t ) >;

  result< header > load_header() const;
  static slot_key make_key( const header& h, std::uint64_t index );
  result< std::uint64_t > slot( const header& h, std::uint64_t index ) const;

  system_interface* _system;
  std::uint32_t _space_id;
};

} // namespace setmint::program
