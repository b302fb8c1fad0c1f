// NOLINTBEGIN

#include <gtest/gtest.h>

#include <fungible/controller/error.hpp>
#include <fungible/program/error.hpp>

TEST( error, program_category )
{
  std::error_code code = fungible::program::program_errc::requires_one_yocto;

  EXPECT_STREQ( code.category().name(), "program" );
  EXPECT_EQ( code.message(), "requires attached deposit of exactly 1 yocto" );
  EXPECT_TRUE( code );

  std::error_code ok = fungible::program::program_errc::ok;
  EXPECT_FALSE( ok );
}

TEST( error, categories_are_distinct )
{
  std::error_code program    = fungible::program::program_errc::not_initialized;
  std::error_code controller = fungible::controller::controller_errc::not_open;

  EXPECT_EQ( program.value(), controller.value() );
  EXPECT_NE( program, controller );
  EXPECT_STREQ( controller.category().name(), "controller" );
  EXPECT_EQ( controller.message(), "controller is not open" );
}

// NOLINTEND
