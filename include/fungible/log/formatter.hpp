#pragma once

#include <span>
#include <string>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <fungible/encode.hpp>
#include <fungible/protocol/types.hpp>

namespace fungible::log {

struct base64_tag
{};

using base64 = quill::BinaryData< base64_tag >;

} // namespace fungible::log

template<>
struct fmtquill::formatter< fungible::log::base64 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const fungible::log::base64& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                fungible::encode::to_base64( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< fungible::log::base64 >: quill::BinaryDataDeferredFormatCodec< fungible::log::base64 >
{};

template<>
struct fmtquill::formatter< fungible::protocol::amount_t >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const fungible::protocol::amount_t& amount, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", amount.str() );
  }
};

template<>
struct quill::Codec< fungible::protocol::amount_t >: quill::DeferredFormatCodec< fungible::protocol::amount_t >
{};
