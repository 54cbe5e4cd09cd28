// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <numeric>
#include <set>
#include <utility>

#include <setmint/program/display_pool.hpp>

namespace {

// Object storage only. Everything else is unused by the pool.
struct object_store final: setmint::program::system_interface
{
  using key_type = std::pair< std::uint32_t, std::vector< std::byte > >;

  std::map< key_type, std::vector< std::byte > > objects;

  std::span< const std::string > arguments() override
  {
    return {};
  }

  std::error_code write( setmint::program::file_descriptor, std::span< const std::byte > ) override
  {
    return {};
  }

  std::error_code read( setmint::program::file_descriptor, std::span< std::byte > ) override
  {
    return setmint::program::program_errc::invalid_argument;
  }

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) override
  {
    if( auto itr = objects.find( { id, { key.begin(), key.end() } } ); itr != objects.end() )
      return itr->second;

    return {};
  }

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) override
  {
    objects[ { id, { key.begin(), key.end() } } ] = { value.begin(), value.end() };
    return {};
  }

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) override
  {
    objects.erase( { id, { key.begin(), key.end() } } );
    return {};
  }

  void log( std::string_view ) override {}

  std::error_code event( std::string_view, std::span< const std::byte >, const std::vector< setmint::protocol::account >& ) override
  {
    return {};
  }

  const setmint::protocol::account& get_caller() override
  {
    return account;
  }

  const setmint::protocol::account& get_self() override
  {
    return account;
  }

  std::uint64_t get_value() override
  {
    return 0;
  }

  std::uint64_t get_balance( const setmint::protocol::account& ) override
  {
    return 0;
  }

  std::error_code transfer_value( const setmint::protocol::account&, std::uint64_t ) override
  {
    return setmint::program::program_errc::insufficient_balance;
  }

  setmint::crypto::digest get_entropy() override
  {
    return {};
  }

  setmint::program::result< setmint::protocol::program_output >
  call_program( const setmint::protocol::account&,
                std::span< const std::byte >,
                std::uint64_t,
                std::span< const std::string > ) override
  {
    return std::unexpected( setmint::program::program_errc::invalid_instruction );
  }

  std::size_t parked( std::uint32_t id ) const
  {
    return std::ranges::count_if( objects,
                                  [ & ]( const auto& entry )
                                  {
                                    return entry.first.first == id && !entry.first.second.empty();
                                  } );
  }

  setmint::protocol::account account{};
};

constexpr std::uint32_t pool_space = 2;

} // namespace

TEST( display_pool, full_draw_is_a_permutation )
{
  object_store store;
  setmint::program::display_pool pool( &store, pool_space );

  constexpr std::uint64_t supply = 257;
  ASSERT_FALSE( pool.reset( supply ) );
  ASSERT_EQ( pool.size().value(), supply );

  std::vector< std::uint64_t > drawn;
  std::uint64_t random = 0x9e3779b97f4a7c15;

  for( std::uint64_t i = 0; i < supply; ++i )
  {
    random = random * 6364136223846793005ull + 1442695040888963407ull;

    auto number = pool.draw( random );
    ASSERT_TRUE( number ) << number.error().message();
    drawn.push_back( *number );

    EXPECT_EQ( pool.size().value(), supply - i - 1 );
    EXPECT_LE( store.parked( pool_space ), supply - i - 1 );
  }

  std::ranges::sort( drawn );
  std::vector< std::uint64_t > expected( supply );
  std::iota( expected.begin(), expected.end(), 0 );
  EXPECT_EQ( drawn, expected );

  EXPECT_EQ( store.parked( pool_space ), 0 );

  auto exhausted = pool.draw( random );
  ASSERT_FALSE( exhausted );
  EXPECT_EQ( exhausted.error(), setmint::program::program_errc::pool_exhausted );
}

TEST( display_pool, swap_and_pop )
{
  object_store store;
  setmint::program::display_pool pool( &store, pool_space );
  ASSERT_FALSE( pool.reset( 5 ) );

  // Drawing slot 1 parks the last number there
  EXPECT_EQ( pool.draw( 1 ).value(), 1 );
  EXPECT_EQ( store.parked( pool_space ), 1 );

  // Slot 1 now yields 4, and slot 3 moves into it
  EXPECT_EQ( pool.draw( 1 ).value(), 4 );

  // Drawing the last slot needs no parking
  EXPECT_EQ( pool.draw( 2 ).value(), 2 );

  // A draw index is taken modulo the remaining size
  EXPECT_EQ( pool.draw( 2 ).value(), 0 );
  EXPECT_EQ( pool.draw( 7 ).value(), 3 );

  EXPECT_EQ( pool.size().value(), 0 );
  EXPECT_EQ( store.parked( pool_space ), 0 );
}

TEST( display_pool, reset_abandons_remaining_numbers )
{
  object_store store;
  setmint::program::display_pool pool( &store, pool_space );
  ASSERT_FALSE( pool.reset( 10 ) );

  ASSERT_TRUE( pool.draw( 0 ) );
  ASSERT_TRUE( pool.draw( 3 ) );
  auto parked = store.parked( pool_space );
  EXPECT_GT( parked, 0 );

  // Parked numbers of the abandoned pool are left in place but never read
  ASSERT_FALSE( pool.reset( 3 ) );
  EXPECT_EQ( store.parked( pool_space ), parked );
  EXPECT_EQ( pool.size().value(), 3 );

  std::set< std::uint64_t > drawn;
  for( int i = 0; i < 3; ++i )
    drawn.insert( pool.draw( 0 ).value() );

  EXPECT_EQ( drawn, ( std::set< std::uint64_t >{ 0, 1, 2 } ) );
  EXPECT_EQ( store.parked( pool_space ), parked );
}

TEST( display_pool, reset_is_independent_of_size )
{
  object_store store;
  setmint::program::display_pool pool( &store, pool_space );

  constexpr std::uint64_t huge = std::uint64_t( 1 ) << 40;
  ASSERT_FALSE( pool.reset( huge ) );
  EXPECT_EQ( pool.draw( 7 ).value(), 7 );
  EXPECT_EQ( pool.size().value(), huge - 1 );

  auto objects = store.objects.size();
  ASSERT_FALSE( pool.reset( huge ) );
  EXPECT_EQ( store.objects.size(), objects );

  // The new generation starts from an untouched range
  EXPECT_EQ( pool.size().value(), huge );
  EXPECT_EQ( pool.draw( 7 ).value(), 7 );
  EXPECT_EQ( pool.draw( 7 ).value(), huge - 1 );
  EXPECT_LE( store.objects.size(), objects + 2 );
}

// NOLINTEND
