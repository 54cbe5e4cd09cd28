#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <setmint/protocol/account.hpp>

namespace setmint::protocol {

/**
 * A notification emitted by a program. Sequence numbers are assigned in
 * emission order within a block and survive only if the emitting call
 * and its transaction succeed.
 */
struct event
{
  std::uint32_t sequence = 0;
  account source{};
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & sequence;
    ar & source;
    ar & name;
    ar & data;
    ar & impacted;
  }
};

} // namespace setmint::protocol
