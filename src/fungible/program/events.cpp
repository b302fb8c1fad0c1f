#include <fungible/program/events.hpp>

namespace fungible::program::events {

static protocol::event make_event( std::string_view name )
{
  protocol::event event;
  event.standard = protocol::nep141_standard;
  event.version  = protocol::nep141_version;
  event.name     = std::string( name );
  return event;
}

std::error_code ft_mint( system_interface* system,
                         std::string_view owner,
                         const protocol::amount_t& amount,
                         const std::optional< std::string >& memo )
{
  auto event = make_event( "ft_mint" );

  nlohmann::ordered_json data;
  data[ "owner_id" ] = std::string( owner );
  data[ "amount" ]   = amount.str();
  if( memo )
    data[ "memo" ] = *memo;

  event.data.push_back( std::move( data ) );
  return system->emit_event( std::move( event ) );
}

std::error_code ft_transfer( system_interface* system,
                             std::string_view old_owner,
                             std::string_view new_owner,
                             const protocol::amount_t& amount,
                             const std::optional< std::string >& memo )
{
  auto event = make_event( "ft_transfer" );

  nlohmann::ordered_json data;
  data[ "old_owner_id" ] = std::string( old_owner );
  data[ "new_owner_id" ] = std::string( new_owner );
  data[ "amount" ]       = amount.str();
  if( memo )
    data[ "memo" ] = *memo;

  event.data.push_back( std::move( data ) );
  return system->emit_event( std::move( event ) );
}

} // namespace fungible::program::events
