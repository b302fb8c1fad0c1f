#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <fungible/protocol/types.hpp>

namespace fungible::protocol {

constexpr std::string_view event_log_prefix = "EVENT_JSON:";

/**
 * A structured event in the NEP-297 envelope.
 */
struct event
{
  std::uint32_t sequence = 0;
  account_id source;
  std::string standard;
  std::string version;
  std::string name;
  nlohmann::ordered_json data = nlohmann::ordered_json::array();

  nlohmann::ordered_json to_json() const;

  /**
   * Returns the event as a single log line, "EVENT_JSON:" followed by the
   * compact JSON envelope.
   */
  std::string to_log_line() const;
};

} // namespace fungible::protocol
