// NOLINTBEGIN

#include <gtest/gtest.h>

#include <stdexcept>

#include <fungible/cli/call_script.hpp>
#include <fungible/program/metadata.hpp>

using fungible::protocol::amount_t;
using fungible::protocol::ft_instruction;

TEST( call_script, parse_call )
{
  auto call = fungible::cli::parse_call(
    R"({"signer":"owner.near","method":"ft_transfer","args":{"receiver_id":"bob.near","amount":"500"},"deposit":"1"})",
    "token.near",
    42 );

  EXPECT_EQ( call.signer, "owner.near" );
  EXPECT_EQ( call.receiver, "token.near" );
  EXPECT_EQ( call.method, "ft_transfer" );
  EXPECT_EQ( call.deposit, amount_t( 1 ) );
  EXPECT_EQ( call.gas, 42 );
  EXPECT_FALSE( call.view );

  EXPECT_EQ( fungible::cli::encode_call( call.method, call.args ),
             fungible::protocol::encode_all( ft_instruction::ft_transfer,
                                             std::string( "bob.near" ),
                                             amount_t( 500 ),
                                             std::optional< std::string >{} ) );
}

TEST( call_script, malformed_calls )
{
  EXPECT_THROW( fungible::cli::parse_call( "{", "token.near", 1 ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_call( "[]", "token.near", 1 ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_call( R"({"method":"ft_metadata"})", "token.near", 1 ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_call( R"({"signer":"a.near","method":"ft_metadata","gas":-1})", "token.near", 1 ),
                std::invalid_argument );

  EXPECT_THROW( fungible::cli::encode_call( "ft_mint", {} ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::encode_call( "ft_transfer", { { "receiver_id", "bob.near" } } ), std::invalid_argument );
}

TEST( call_script, amounts )
{
  EXPECT_EQ( fungible::cli::parse_amount( "340282366920938463463374607431768211455" ),
             std::numeric_limits< amount_t >::max() );
  EXPECT_EQ( fungible::cli::parse_amount( 17u ), amount_t( 17 ) );

  EXPECT_THROW( fungible::cli::parse_amount( "340282366920938463463374607431768211456" ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_amount( "-1" ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_amount( "" ), std::invalid_argument );
  EXPECT_THROW( fungible::cli::parse_amount( 1.5 ), std::invalid_argument );
}

TEST( call_script, decode_result )
{
  EXPECT_EQ( fungible::cli::decode_result( "ft_balance_of", fungible::protocol::encode_all( std::optional< amount_t >{ 500 } ) ),
             "500" );
  EXPECT_TRUE( fungible::cli::decode_result( "ft_balance_of", fungible::protocol::encode_all( std::optional< amount_t >{} ) )
                 .is_null() );
  EXPECT_EQ( fungible::cli::decode_result( "storage_unregister", fungible::protocol::encode_all( true ) ), true );
  EXPECT_TRUE( fungible::cli::decode_result( "ft_transfer", {} ).is_null() );

  auto malformed = fungible::cli::decode_result( "ft_total_supply", std::vector< std::byte >{ std::byte{ 0x01 } } );
  EXPECT_EQ( malformed[ "raw" ], "AQ==" );
}

TEST( call_script, metadata )
{
  auto metadata = fungible::program::default_metadata();
  metadata.reference      = "https://example.com/token.json";
  metadata.reference_hash = std::vector< std::byte >( 32, std::byte{ 0x00 } );

  auto value = fungible::cli::metadata_to_json( metadata );
  EXPECT_EQ( value[ "symbol" ], "EXAMPLE" );
  EXPECT_EQ( value[ "decimals" ], 24 );
  EXPECT_EQ( value[ "reference_hash" ], "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=" );

  EXPECT_EQ( fungible::cli::metadata_from_json( nlohmann::json::parse( value.dump() ) ), metadata );

  value[ "decimals" ] = 256;
  EXPECT_THROW( fungible::cli::metadata_from_json( nlohmann::json::parse( value.dump() ) ), std::invalid_argument );
}

// NOLINTEND
