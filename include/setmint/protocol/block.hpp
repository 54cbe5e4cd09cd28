#pragma once

#include <cstdint>
#include <vector>

#include <setmint/crypto.hpp>
#include <setmint/protocol/transaction.hpp>

namespace setmint::protocol {

struct block
{
  crypto::digest id{};
  crypto::digest previous{};
  std::uint64_t height    = 0;
  std::uint64_t timestamp = 0;
  std::vector< transaction > transactions;

  bool validate() const noexcept;
};

struct block_receipt
{
  crypto::digest id{};
  std::uint64_t height = 0;
  std::vector< transaction_receipt > transaction_receipts;
};

crypto::digest make_id( const block& b );

/**
 * The unpredictable value programs draw randomness from while the block
 * is applied. Producers can influence it, callers cannot.
 */
crypto::digest make_entropy( const block& b );

} // namespace setmint::protocol
