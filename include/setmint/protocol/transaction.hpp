#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <setmint/crypto.hpp>
#include <setmint/protocol/account.hpp>
#include <setmint/protocol/event.hpp>
#include <setmint/protocol/operation.hpp>
#include <setmint/protocol/program.hpp>

namespace setmint::protocol {

/**
 * A signed batch of operations. Signature verification happens before a
 * transaction reaches the controller; the signer field is trusted here.
 */
struct transaction
{
  crypto::digest id{};
  account signer{};
  std::uint64_t nonce = 0;
  std::vector< operation > operations;

  std::size_t size() const noexcept;
  bool validate() const noexcept;
};

struct transaction_receipt
{
  crypto::digest id{};
  bool reverted = false;
  std::int32_t code = 0;
  std::string message;
  account signer{};
  std::vector< std::shared_ptr< program_frame > > frames;
  std::vector< event > events;
  std::vector< std::string > logs;
};

crypto::digest make_id( const transaction& t );

} // namespace setmint::protocol

template< typename T >
concept Transaction = std::same_as< setmint::protocol::transaction, T >;
