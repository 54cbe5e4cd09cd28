// NOLINTBEGIN

#include <gtest/gtest.h>
#include <setmint/crypto/hash.hpp>
#include <setmint/encode.hpp>

#include <vector>

TEST( hash, blake3 )
{
  auto empty = setmint::crypto::hash( std::string_view{} );
  EXPECT_EQ( setmint::encode::to_hex( empty ), "0xaf1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" );

  auto one_shot = setmint::crypto::hash( "A quick brown fox jumps over the lazy dog" );
  auto incremental =
    setmint::crypto::hasher().update( "A quick brown fox " ).update( "jumps over the lazy dog" ).finalize();
  EXPECT_EQ( one_shot, incremental );

  std::vector< std::vector< std::byte > > bytes = {
    {std::byte{ 0x01 }, std::byte{ 0x02 }, std::byte{ 0x03 }},
    {std::byte{ 0x04 }, std::byte{ 0x05 }, std::byte{ 0x06 }}
  };

  std::vector< std::span< const std::byte > > byte_spans;
  for( const auto& b: bytes )
    byte_spans.push_back( std::span( b ) );

  std::array< std::byte, 6 > flat{ std::byte{ 0x01 },
                                   std::byte{ 0x02 },
                                   std::byte{ 0x03 },
                                   std::byte{ 0x04 },
                                   std::byte{ 0x05 },
                                   std::byte{ 0x06 } };

  auto nested = setmint::crypto::hasher().update( bytes ).finalize();
  EXPECT_EQ( nested, setmint::crypto::hasher().update( byte_spans ).finalize() );
  EXPECT_EQ( nested, setmint::crypto::hash( flat.data(), flat.size() ) );
}

TEST( hash, integers_are_little_endian )
{
  std::uint64_t number = 12'345;
  std::array< std::byte, 8 > le{ std::byte{ 0x39 }, std::byte{ 0x30 } };

  EXPECT_EQ( setmint::crypto::hash_all( number ), setmint::crypto::hash( le.data(), le.size() ) );
  EXPECT_NE( setmint::crypto::hash_all( number ), setmint::crypto::hash_all( number + 1 ) );
}

// NOLINTEND
