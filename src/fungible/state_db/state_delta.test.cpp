// NOLINTBEGIN

#include <gtest/gtest.h>

#include <fungible/state_db/database.hpp>
#include <fungible/state_db/state_delta.hpp>
#include <fungible/state_db/types.hpp>

TEST( state_delta, crud )
{
  auto delta = std::make_shared< fungible::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_EQ( delta->revision(), 0 );
  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->get( { std::byte{ 0x01 } } ) );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), key_1.size() + value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -std::ssize( key_1 ) - std::ssize( value_1a ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );
}

TEST( state_delta, child_reads_through_parent )
{
  auto parent = std::make_shared< fungible::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = parent->make_child();
  EXPECT_FALSE( child->root() );
  EXPECT_EQ( child->parent(), parent );
  EXPECT_EQ( child->revision(), 1 );

  ASSERT_TRUE( child->get( key_1 ) );
  EXPECT_TRUE( std::ranges::equal( *child->get( key_1 ), value_1 ) );

  EXPECT_EQ( child->remove( std::vector< std::byte >( key_1 ) ), -2 );
  EXPECT_FALSE( child->get( key_1 ) );
  EXPECT_TRUE( parent->get( key_1 ) );

  std::vector< std::byte > value_2a{ std::byte{ 0x21 }, std::byte{ 0x22 } };
  EXPECT_EQ( child->put( std::vector< std::byte >( key_2 ), value_2a ), 1 );
  EXPECT_TRUE( std::ranges::equal( *parent->get( key_2 ), value_2 ) );
}

TEST( state_delta, squash )
{
  auto parent = std::make_shared< fungible::state_db::state_delta >();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  auto child = parent->make_child();
  auto grandchild = child->make_child();

  grandchild->remove( std::vector< std::byte >( key_1 ) );
  grandchild->put( std::vector< std::byte >( key_3 ), value_3 );
  grandchild->squash();

  EXPECT_TRUE( child->removed( key_1 ) );
  EXPECT_FALSE( child->get( key_1 ) );
  EXPECT_TRUE( child->get( key_3 ) );
  EXPECT_TRUE( parent->get( key_1 ) );
  EXPECT_FALSE( parent->get( key_3 ) );

  child->put( std::vector< std::byte >( key_1 ), value_2 );
  EXPECT_FALSE( child->removed( key_1 ) );
  child->remove( std::vector< std::byte >( key_2 ) );
  child->squash();

  ASSERT_TRUE( parent->get( key_1 ) );
  EXPECT_TRUE( std::ranges::equal( *parent->get( key_1 ), value_2 ) );
  EXPECT_FALSE( parent->get( key_2 ) );
  EXPECT_TRUE( parent->get( key_3 ) );

  EXPECT_THROW( parent->squash(), std::runtime_error );
}

TEST( state_node, squash_and_discard )
{
  fungible::state_db::database db;
  EXPECT_FALSE( db.root() );

  fungible::state_db::object_space space{ .system = false, .owner = "token", .id = 1 };
  fungible::state_db::object_space other{ .system = false, .owner = "token2", .id = 1 };
  std::vector< std::byte > key{ std::byte{ 0x01 } }, value{ std::byte{ 0x10 } };

  db.open(
    [ & ]( fungible::state_db::state_node_ptr& root )
    {
      root->put( space, key, value );
    } );

  ASSERT_TRUE( db.is_open() );
  EXPECT_THROW( db.open( {} ), std::runtime_error );

  auto root = db.root();
  ASSERT_TRUE( root->get( space, key ) );
  EXPECT_FALSE( root->get( other, key ) );

  auto discarded = root->make_child();
  discarded->remove( space, key );
  discarded->put( other, key, value );
  discarded->discard();
  EXPECT_THROW( discarded->get( space, key ), std::runtime_error );

  EXPECT_TRUE( root->get( space, key ) );
  EXPECT_FALSE( root->get( other, key ) );

  auto squashed = root->make_child();
  squashed->put( other, key, value );
  squashed->squash();
  EXPECT_THROW( squashed->squash(), std::runtime_error );

  EXPECT_TRUE( root->get( other, key ) );

  db.close();
  EXPECT_FALSE( db.root() );
}

TEST( state_node, compound_keys_are_distinct )
{
  std::vector< std::byte > key{ std::byte{ 0x01 } };

  auto a = fungible::state_db::make_compound_key( { .system = false, .owner = "ab", .id = 1 }, key );
  auto b = fungible::state_db::make_compound_key( { .system = true, .owner = "ab", .id = 1 }, key );
  auto c = fungible::state_db::make_compound_key( { .system = false, .owner = "ab", .id = 2 }, key );
  auto d = fungible::state_db::make_compound_key( { .system = false, .owner = "abc", .id = 1 }, key );

  EXPECT_NE( a, b );
  EXPECT_NE( a, c );
  EXPECT_NE( a, d );
}

// NOLINTEND
