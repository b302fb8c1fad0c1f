#include <fungible/protocol/account.hpp>

namespace fungible::protocol {

static bool separator( char c ) noexcept
{
  return c == '-' || c == '_' || c == '.';
}

static bool alphanumeric( char c ) noexcept
{
  return ( c >= 'a' && c <= 'z' ) || ( c >= '0' && c <= '9' );
}

bool valid_account_id( std::string_view id ) noexcept
{
  if( id.size() < min_account_id_length || id.size() > max_account_id_length )
    return false;

  bool last_was_separator = true;

  for( char c: id )
  {
    if( separator( c ) )
    {
      if( last_was_separator )
        return false;

      last_was_separator = true;
    }
    else if( alphanumeric( c ) )
    {
      last_was_separator = false;
    }
    else
    {
      return false;
    }
  }

  return !last_was_separator;
}

} // namespace fungible::protocol
