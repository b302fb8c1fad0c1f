#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace fungible::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

/**
 * Objects are partitioned by owning account and a space id chosen by the
 * owner. System spaces belong to the runtime rather than a program.
 */
struct object_space
{
  bool system = false;
  std::string owner;
  std::uint32_t id = 0;

  bool operator==( const object_space& ) const = default;
};

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;
using genesis_init_function    = std::function< void( state_node_ptr& ) >;

} // namespace fungible::state_db
