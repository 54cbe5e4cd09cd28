#include <setmint/crypto/hash.hpp>
#include <setmint/memory/memory.hpp>

#include <cstdint>

#include <blake3.h>

namespace setmint::crypto {

struct hasher::impl
{
  blake3_hasher state{};
};

hasher::hasher():
    _impl( std::make_unique< impl >() )
{
  blake3_hasher_init( &_impl->state );
}

hasher::hasher( hasher&& ) noexcept            = default;
hasher::~hasher()                              = default;
hasher& hasher::operator=( hasher&& ) noexcept = default;

hasher& hasher::update( const void* ptr, std::size_t len )
{
  blake3_hasher_update( &_impl->state, ptr, len );
  return *this;
}

hasher& hasher::update( std::string_view sv )
{
  return update( sv.data(), sv.size() );
}

digest hasher::finalize() const
{
  digest out{};
  blake3_hasher_finalize( &_impl->state, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( const void* ptr, std::size_t len )
{
  return hasher().update( ptr, len ).finalize();
}

digest hash( std::string_view sv )
{
  return hash( sv.data(), sv.size() );
}

} // namespace setmint::crypto
