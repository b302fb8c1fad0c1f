#include <fungible/protocol/event.hpp>

namespace fungible::protocol {

nlohmann::ordered_json event::to_json() const
{
  nlohmann::ordered_json envelope;
  envelope[ "standard" ] = standard;
  envelope[ "version" ]  = version;
  envelope[ "event" ]    = name;
  envelope[ "data" ]     = data;
  return envelope;
}

std::string event::to_log_line() const
{
  return std::string( event_log_prefix ) + to_json().dump();
}

} // namespace fungible::protocol
