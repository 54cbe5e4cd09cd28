#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/serialization/string.hpp>

#include <setmint/program/display_pool.hpp>
#include <setmint/program/error.hpp>
#include <setmint/program/program.hpp>
#include <setmint/program/random_source.hpp>

namespace setmint::program {

constexpr std::uint64_t max_batch_limit      = 100;
constexpr std::uint64_t default_batch_limit  = 10;
constexpr std::uint64_t royalty_denominator  = 10'000;

/**
 * Constructor arguments of a sale.
 */
struct deployment_bundle
{
  std::string name;
  std::string symbol;
  protocol::account owner{};
  std::uint64_t coin_fee  = 0;
  std::uint64_t token_fee = 0;
  protocol::account fee_address{};
  protocol::account payment_token{};
  std::string base_uri;
  std::string contract_uri;
  std::uint64_t max_supply        = 0;
  std::uint64_t royalty_numerator = 0;
};

/**
 * Sells sequentially numbered non-fungible tokens in sets.
 *
 * Each set has its own supply cap, counter and base URI. Tokens minted in
 * the active set receive a display number drawn from a display_pool, and
 * their URI is the set's base URI followed by that number.
 */
class minter final: public program
{
public:
  enum class instruction : std::uint32_t // NOLINT(performance-enum-size)
  {
    initialize,
    mint,

    set_token_fee,
    set_coin_fee,
    set_fee_address,
    set_batch_limit,
    set_base_uri,
    set_contract_uri,
    set_royalty,
    pause,
    start_set,
    withdraw_coin,
    withdraw_tokens,
    transfer_ownership,

    name,
    symbol,
    owner,
    payment_token,
    max_supply,
    counter,
    token_fee,
    coin_fee,
    fee_address,
    batch_limit,
    base_uri,
    contract_uri,
    paused,
    current_set,
    token_uri,
    royalty_info,

    owner_of,
    balance_of,
    total_supply,
    transfer,
    burn
  };

  struct collection_record
  {
    protocol::account owner{};
    std::string name;
    std::string symbol;
    bool paused               = true;
    std::uint64_t batch_limit = default_batch_limit;
    std::uint64_t coin_fee    = 0;
    std::uint64_t token_fee   = 0;
    protocol::account fee_address{};
    protocol::account payment_token{};
    protocol::account royalty_receiver{};
    std::uint64_t royalty_numerator = 0;
    std::string contract_uri;
    std::uint64_t current_set   = 0;
    std::uint64_t next_token_id = 1;
    std::uint64_t burned        = 0;
    bool entered                = false;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & owner;
      ar & name;
      ar & symbol;
      ar & paused;
      ar & batch_limit;
      ar & coin_fee;
      ar & token_fee;
      ar & fee_address;
      ar & payment_token;
      ar & royalty_receiver;
      ar & royalty_numerator;
      ar & contract_uri;
      ar & current_set;
      ar & next_token_id;
      ar & burned;
      ar & entered;
    }
  };

  struct set_record
  {
    std::uint64_t max_supply = 0;
    std::uint64_t counter    = 0;
    std::string base_uri;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & max_supply;
      ar & counter;
      ar & base_uri;
    }
  };

  struct token_record
  {
    protocol::account owner{};
    std::uint64_t set            = 0;
    std::uint64_t display_number = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & owner;
      ar & set;
      ar & display_number;
    }
  };

  /**
   * Payload of every setter event: the account that made the change and
   * the new value.
   */
  template< typename T >
  struct update_event
  {
    protocol::account actor{};
    T value{};

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & actor;
      ar & value;
    }
  };

  struct set_update
  {
    std::uint64_t set = 0;
    set_record record;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & set;
      ar & record;
    }
  };

  struct royalty_update
  {
    protocol::account receiver{};
    std::uint64_t numerator = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & receiver;
      ar & numerator;
    }
  };

  struct withdrawal
  {
    protocol::account token{};
    protocol::account receiver{};
    std::uint64_t amount = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & token;
      ar & receiver;
      ar & amount;
    }
  };

  struct mint_event
  {
    protocol::account to{};
    std::uint64_t token_id       = 0;
    std::uint64_t set            = 0;
    std::uint64_t display_number = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & to;
      ar & token_id;
      ar & set;
      ar & display_number;
    }
  };

  struct transfer_event
  {
    protocol::account from{};
    protocol::account to{};
    std::uint64_t token_id = 0;

    template< class Archive >
    void serialize( Archive& ar, const unsigned int version )
    {
      ar & from;
      ar & to;
      ar & token_id;
    }
  };

  explicit minter( const protocol::account& deployer,
                   std::shared_ptr< random_source > source = std::make_shared< chain_random_source >() );
  minter( const minter& ) = delete;
  minter( minter&& )      = delete;
  ~minter() override      = default;

  minter& operator=( const minter& ) = delete;
  minter& operator=( minter&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  std::error_code initialize( system_interface* system );
  std::error_code mint( system_interface* system, collection_record& collection );
  std::error_code collect_fees( system_interface* system,
                                const collection_record& collection,
                                std::uint64_t total_token_fee,
                                std::uint64_t total_coin_fee );

  std::error_code administer( system_interface* system, instruction instr, collection_record& collection );
  std::error_code withdraw_tokens( system_interface* system,
                                   const protocol::account& token_program,
                                   const protocol::account& receiver );

  std::error_code query( system_interface* system, instruction instr, const collection_record& collection );

  std::error_code transfer( system_interface* system, collection_record& collection );
  std::error_code burn( system_interface* system, collection_record& collection );

  protocol::account _deployer;
  std::shared_ptr< random_source > _random;
};

std::vector< std::byte > make_initialize_input( const deployment_bundle& bundle );

} // namespace setmint::program
