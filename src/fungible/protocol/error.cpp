#include <fungible/protocol/error.hpp>

#include <string>
#include <utility>

namespace fungible::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _protocol_category::name() const noexcept
{
  return "protocol";
}

std::string _protocol_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< protocol_errc >( condition ) )
  {
    case protocol_errc::ok:
      return "ok"s;
    case protocol_errc::unexpected_end_of_input:
      return "unexpected end of input"s;
    case protocol_errc::invalid_boolean:
      return "invalid boolean"s;
    case protocol_errc::invalid_optional:
      return "invalid optional tag"s;
    case protocol_errc::length_exceeded:
      return "length exceeded"s;
  }
  std::unreachable();
}

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace fungible::protocol
