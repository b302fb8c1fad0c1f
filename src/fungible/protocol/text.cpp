#include <fungible/protocol/text.hpp>

#include <boost/locale/utf.hpp>

namespace fungible::protocol {

bool valid_utf8( std::string_view str ) noexcept
{
  auto it = str.begin();
  while( it != str.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< char >::decode( it, str.end() );
    if( cp == boost::locale::utf::illegal )
      return false;
    else if( cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

bool valid_utf8( const nlohmann::ordered_json& value ) noexcept
{
  if( value.is_string() )
    return valid_utf8( std::string_view( value.get_ref< const std::string& >() ) );

  if( value.is_object() )
  {
    for( const auto& [ key, element ]: value.items() )
      if( !valid_utf8( std::string_view( key ) ) || !valid_utf8( element ) )
        return false;
  }
  else if( value.is_array() )
  {
    for( const auto& element: value )
      if( !valid_utf8( element ) )
        return false;
  }

  return true;
}

} // namespace fungible::protocol
