// NOLINTBEGIN

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include <fungible/controller/state.hpp>

using fungible::controller::controller_errc;
using fungible::protocol::amount_t;
namespace state = fungible::controller::state;

TEST( native_balance, credit_refuses_to_wrap )
{
  constexpr auto max = std::numeric_limits< amount_t >::max();

  fungible::state_db::database db;
  db.open(
    [max]( fungible::state_db::state_node_ptr& root )
    {
      state::set_native_balance( *root, "alice.near", max - 10 );
    } );

  auto node = db.root()->make_child();
  EXPECT_EQ( state::credit_native_balance( *node, "alice.near", 11 ), controller_errc::balance_overflow );
  EXPECT_EQ( state::native_balance( *node, "alice.near" ), max - 10 );

  EXPECT_FALSE( state::credit_native_balance( *node, "alice.near", 10 ) );
  EXPECT_EQ( state::native_balance( *node, "alice.near" ), max );

  EXPECT_EQ( state::credit_native_balance( *node, "bob.near", 1 ), controller_errc::account_not_found );
  EXPECT_FALSE( state::native_balance( *node, "bob.near" ) );
}

TEST( native_balance, failed_genesis_leaves_database_closed )
{
  fungible::state_db::database db;
  EXPECT_THROW( db.open( []( fungible::state_db::state_node_ptr& ) { throw std::runtime_error( "bad genesis" ); } ),
                std::runtime_error );
  EXPECT_FALSE( db.is_open() );
}

// NOLINTEND
