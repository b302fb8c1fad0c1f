#include <fungible/controller/state.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

namespace fungible::controller::state {
namespace space {

enum class system_space_id : std::uint8_t
{
  native_balance = 0
};

const state_db::object_space& native_balance()
{
  static state_db::object_space s{ .system = true, .id = std::to_underlying( system_space_id::native_balance ) };
  return s;
}

} // namespace space

std::optional< protocol::amount_t > native_balance( const state_db::state_node& node, std::string_view account )
{
  auto object = node.get( space::native_balance(), memory::as_bytes( account ) );
  if( !object )
    return {};

  protocol::amount_t balance = 0;
  protocol::decoder decoder( *object );
  if( decoder.read( balance ) )
    throw std::runtime_error( "malformed native balance" );

  return balance;
}

void set_native_balance( state_db::state_node& node, std::string_view account, const protocol::amount_t& balance )
{
  node.put( space::native_balance(), memory::as_bytes( account ), protocol::encode_all( balance ) );
}

std::error_code
credit_native_balance( state_db::state_node& node, std::string_view account, const protocol::amount_t& amount )
{
  auto balance = native_balance( node, account );
  if( !balance )
    return controller_errc::account_not_found;

  if( std::numeric_limits< protocol::amount_t >::max() - *balance < amount )
    return controller_errc::balance_overflow;

  set_native_balance( node, account, *balance + amount );
  return controller_errc::ok;
}

} // namespace fungible::controller::state
