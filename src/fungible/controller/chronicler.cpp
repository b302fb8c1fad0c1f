#include <fungible/controller/chronicler.hpp>

namespace fungible::controller {

void chronicler::push_event( protocol::event&& event )
{
  event.sequence = static_cast< std::uint32_t >( _events.size() );
  _logs.push_back( event.to_log_line() );
  _events.emplace_back( std::move( event ) );
}

void chronicler::push_log( std::string&& message )
{
  _logs.emplace_back( std::move( message ) );
}

void chronicler::push_warning( std::error_code warning )
{
  _warnings.push_back( warning );
}

std::vector< protocol::event >& chronicler::events() noexcept
{
  return _events;
}

std::vector< std::string >& chronicler::logs() noexcept
{
  return _logs;
}

std::vector< std::error_code >& chronicler::warnings() noexcept
{
  return _warnings;
}

} // namespace fungible::controller
