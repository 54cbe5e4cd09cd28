#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <setmint/encode/hex.hpp>

namespace setmint::log {

struct hex_tag
{};

/**
 * Binary data rendered as a 0x prefixed hex string on the backend thread.
 */
using hex = quill::BinaryData< hex_tag >;

} // namespace setmint::log

template<>
struct fmtquill::formatter< setmint::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const setmint::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                setmint::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< setmint::log::hex >: quill::BinaryDataDeferredFormatCodec< setmint::log::hex >
{};
