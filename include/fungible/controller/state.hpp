#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <fungible/controller/error.hpp>
#include <fungible/protocol.hpp>
#include <fungible/state_db.hpp>

namespace fungible::controller { namespace state {

namespace space {

const state_db::object_space& native_balance();

} // namespace space

struct genesis_entry
{
  protocol::account_id id;
  protocol::amount_t balance = 0;
};

using genesis_data = std::vector< genesis_entry >;

struct runtime_config
{
  protocol::amount_t storage_byte_cost    = protocol::amount_t( 10'000'000'000'000'000'000ull );
  protocol::gas_t max_prepaid_gas         = 300 * protocol::tera_gas;
  protocol::gas_t view_gas                = 300 * protocol::tera_gas;
  protocol::gas_t host_call_cost          = 1'000'000'000;
  protocol::gas_t storage_write_byte_cost = 10'000'000;
  protocol::gas_t receipt_base_cost       = 500'000'000'000;
};

/**
 * Native balance of an account. An account exists if and only if it has a
 * native balance entry.
 */
std::optional< protocol::amount_t > native_balance( const state_db::state_node& node, std::string_view account );
void set_native_balance( state_db::state_node& node, std::string_view account, const protocol::amount_t& balance );

/**
 * Adds to an existing native balance. Fails with account_not_found or
 * balance_overflow and leaves the node untouched.
 */
std::error_code
credit_native_balance( state_db::state_node& node, std::string_view account, const protocol::amount_t& amount );

}} // namespace fungible::controller::state
