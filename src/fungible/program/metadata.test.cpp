// NOLINTBEGIN

#include <gtest/gtest.h>

#include <fungible/program/error.hpp>
#include <fungible/program/metadata.hpp>

using fungible::program::program_errc;

TEST( metadata, default_metadata_is_valid )
{
  auto metadata = fungible::program::default_metadata();

  EXPECT_FALSE( fungible::program::validate( metadata ) );
  EXPECT_EQ( metadata.spec, "ft-1.0.0" );
  EXPECT_EQ( metadata.symbol, "EXAMPLE" );
  EXPECT_EQ( metadata.decimals, 24 );
  ASSERT_TRUE( metadata.icon.has_value() );
  EXPECT_TRUE( metadata.icon->starts_with( "data:image/svg+xml," ) );
}

TEST( metadata, spec_tag )
{
  auto metadata = fungible::program::default_metadata();
  metadata.spec = "ft-1.1.0";
  EXPECT_EQ( fungible::program::validate( metadata ), program_errc::invalid_metadata );
}

TEST( metadata, reference_pairing )
{
  auto metadata      = fungible::program::default_metadata();
  metadata.reference = "https://example.com/token.json";
  EXPECT_EQ( fungible::program::validate( metadata ), program_errc::invalid_metadata );

  metadata.reference_hash = std::vector< std::byte >( 32, std::byte{ 0xab } );
  EXPECT_FALSE( fungible::program::validate( metadata ) );

  metadata.reference_hash = std::vector< std::byte >( 31, std::byte{ 0xab } );
  EXPECT_EQ( fungible::program::validate( metadata ), program_errc::invalid_metadata );

  metadata.reference.reset();
  metadata.reference_hash = std::vector< std::byte >( 32, std::byte{ 0xab } );
  EXPECT_EQ( fungible::program::validate( metadata ), program_errc::invalid_metadata );
}

// NOLINTEND
