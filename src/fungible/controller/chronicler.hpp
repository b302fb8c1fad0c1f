#pragma once

#include <fungible/protocol.hpp>

#include <string>
#include <system_error>
#include <vector>

namespace fungible::controller {

/**
 * Records what a receipt emitted: events, log lines and warnings. Event log
 * lines are interleaved with plain log lines in emission order.
 */
class chronicler final
{
public:
  void push_event( protocol::event&& event );
  void push_log( std::string&& message );
  void push_warning( std::error_code warning );

  std::vector< protocol::event >& events() noexcept;
  std::vector< std::string >& logs() noexcept;
  std::vector< std::error_code >& warnings() noexcept;

private:
  std::vector< protocol::event > _events;
  std::vector< std::string > _logs;
  std::vector< std::error_code > _warnings;
};

} // namespace fungible::controller
