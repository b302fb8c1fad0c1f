#include <fungible/cli/call_script.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>

#include <fungible/encode.hpp>

namespace fungible::cli {

using protocol::ft_instruction;

namespace {

const std::map< std::string, ft_instruction, std::less<> >& methods()
{
  static const std::map< std::string, ft_instruction, std::less<> > m{
    { "new",                    ft_instruction::initialize                  },
    { "new_default_meta",       ft_instruction::initialize_default_metadata },
    { "ft_transfer",            ft_instruction::ft_transfer                 },
    { "ft_transfer_call",       ft_instruction::ft_transfer_call            },
    { "ft_resolve_transfer",    ft_instruction::ft_resolve_transfer         },
    { "ft_total_supply",        ft_instruction::ft_total_supply             },
    { "ft_balance_of",          ft_instruction::ft_balance_of               },
    { "ft_metadata",            ft_instruction::ft_metadata                 },
    { "storage_deposit",        ft_instruction::storage_deposit             },
    { "storage_withdraw",       ft_instruction::storage_withdraw            },
    { "storage_unregister",     ft_instruction::storage_unregister          },
    { "storage_balance_bounds", ft_instruction::storage_balance_bounds      },
    { "storage_balance_of",     ft_instruction::storage_balance_of          }
  };
  return m;
}

ft_instruction find_method( const std::string& method )
{
  auto itr = methods().find( method );
  if( itr == methods().end() )
    throw std::invalid_argument( "unknown method: " + method );

  return itr->second;
}

std::string required_string( const nlohmann::json& args, const std::string& key )
{
  if( !args.contains( key ) || !args[ key ].is_string() )
    throw std::invalid_argument( "missing string argument: " + key );

  return args[ key ].get< std::string >();
}

std::optional< std::string > optional_string( const nlohmann::json& args, const std::string& key )
{
  if( !args.contains( key ) || args[ key ].is_null() )
    return {};

  return required_string( args, key );
}

std::optional< bool > optional_bool( const nlohmann::json& args, const std::string& key )
{
  if( !args.contains( key ) || args[ key ].is_null() )
    return {};

  if( !args[ key ].is_boolean() )
    throw std::invalid_argument( "expected a boolean argument: " + key );

  return args[ key ].get< bool >();
}

protocol::amount_t required_amount( const nlohmann::json& args, const std::string& key )
{
  if( !args.contains( key ) )
    throw std::invalid_argument( "missing amount argument: " + key );

  return parse_amount( args[ key ] );
}

std::optional< protocol::amount_t > optional_amount( const nlohmann::json& args, const std::string& key )
{
  if( !args.contains( key ) || args[ key ].is_null() )
    return {};

  return parse_amount( args[ key ] );
}

nlohmann::ordered_json storage_balance_to_json( const protocol::storage_balance& balance )
{
  nlohmann::ordered_json value;
  value[ "total" ]     = balance.total.str();
  value[ "available" ] = balance.available.str();
  return value;
}

template< typename T >
std::optional< T > decode( std::span< const std::byte > output )
{
  T value{};
  protocol::decoder decoder( output );
  if( decoder.read( value ) )
    return {};

  return value;
}

} // namespace

protocol::amount_t parse_amount( const nlohmann::json& value )
{
  if( value.is_number_unsigned() )
    return protocol::amount_t( value.get< std::uint64_t >() );

  if( !value.is_string() )
    throw std::invalid_argument( "amounts must be base-10 strings" );

  const auto& text = value.get_ref< const std::string& >();
  if( text.empty() || text.size() > 39
      || !std::ranges::all_of( text,
                               []( unsigned char c )
                               {
                                 return std::isdigit( c ) != 0;
                               } ) )
    throw std::invalid_argument( "invalid amount: " + text );

  // 39 digits may still exceed 2^128 - 1
  boost::multiprecision::uint256_t wide( text );
  if( wide > boost::multiprecision::uint256_t( std::numeric_limits< protocol::amount_t >::max() ) )
    throw std::invalid_argument( "amount out of range: " + text );

  return protocol::amount_t( text );
}

protocol::token_metadata metadata_from_json( const nlohmann::json& value )
{
  if( !value.is_object() )
    throw std::invalid_argument( "metadata must be an object" );

  protocol::token_metadata metadata;
  metadata.spec      = required_string( value, "spec" );
  metadata.name      = required_string( value, "name" );
  metadata.symbol    = required_string( value, "symbol" );
  metadata.icon      = optional_string( value, "icon" );
  metadata.reference = optional_string( value, "reference" );

  if( auto hash = optional_string( value, "reference_hash" ); hash )
  {
    auto bytes = encode::from_base64( *hash );
    if( !bytes )
      throw std::invalid_argument( "reference_hash: " + bytes.error().message() );

    metadata.reference_hash = std::move( *bytes );
  }

  if( !value.contains( "decimals" ) || !value[ "decimals" ].is_number_unsigned()
      || value[ "decimals" ].get< std::uint64_t >() > std::numeric_limits< std::uint8_t >::max() )
    throw std::invalid_argument( "decimals must be a number between 0 and 255" );

  metadata.decimals = value[ "decimals" ].get< std::uint8_t >();
  return metadata;
}

nlohmann::ordered_json metadata_to_json( const protocol::token_metadata& metadata )
{
  nlohmann::ordered_json value;
  value[ "spec" ]           = metadata.spec;
  value[ "name" ]           = metadata.name;
  value[ "symbol" ]         = metadata.symbol;
  value[ "icon" ]           = metadata.icon ? nlohmann::ordered_json( *metadata.icon ) : nullptr;
  value[ "reference" ]      = metadata.reference ? nlohmann::ordered_json( *metadata.reference ) : nullptr;
  value[ "reference_hash" ] =
    metadata.reference_hash ? nlohmann::ordered_json( encode::to_base64( *metadata.reference_hash ) ) : nullptr;
  value[ "decimals" ] = metadata.decimals;
  return value;
}

call parse_call( std::string_view line, const protocol::account_id& default_receiver, protocol::gas_t default_gas )
{
  nlohmann::json value;

  try
  {
    value = nlohmann::json::parse( line );
  }
  catch( const nlohmann::json::parse_error& e )
  {
    throw std::invalid_argument( std::string( "malformed call: " ) + e.what() );
  }

  if( !value.is_object() )
    throw std::invalid_argument( "a call must be a JSON object" );

  call c;
  c.signer   = required_string( value, "signer" );
  c.receiver = optional_string( value, "receiver" ).value_or( default_receiver );
  c.method   = required_string( value, "method" );
  c.deposit  = optional_amount( value, "deposit" ).value_or( 0 );
  c.gas      = default_gas;
  c.view     = optional_bool( value, "view" ).value_or( false );

  if( value.contains( "gas" ) )
  {
    if( !value[ "gas" ].is_number_unsigned() )
      throw std::invalid_argument( "gas must be an unsigned number" );

    c.gas = value[ "gas" ].get< protocol::gas_t >();
  }

  if( value.contains( "args" ) )
  {
    if( !value[ "args" ].is_object() )
      throw std::invalid_argument( "args must be an object" );

    c.args = value[ "args" ];
  }

  return c;
}

std::vector< std::byte > encode_call( const std::string& method, const nlohmann::json& args )
{
  auto instruction = find_method( method );

  switch( instruction )
  {
    case ft_instruction::initialize:
      return protocol::encode_all( instruction,
                                   required_string( args, "owner_id" ),
                                   required_amount( args, "total_supply" ),
                                   metadata_from_json( args.value( "metadata", nlohmann::json() ) ) );
    case ft_instruction::initialize_default_metadata:
      return protocol::encode_all( instruction,
                                   required_string( args, "owner_id" ),
                                   required_amount( args, "total_supply" ) );
    case ft_instruction::ft_transfer:
      return protocol::encode_all( instruction,
                                   required_string( args, "receiver_id" ),
                                   required_amount( args, "amount" ),
                                   optional_string( args, "memo" ) );
    case ft_instruction::ft_transfer_call:
      return protocol::encode_all( instruction,
                                   required_string( args, "receiver_id" ),
                                   required_amount( args, "amount" ),
                                   optional_string( args, "memo" ),
                                   required_string( args, "msg" ) );
    case ft_instruction::ft_resolve_transfer:
      return protocol::encode_all( instruction,
                                   required_string( args, "sender_id" ),
                                   required_string( args, "receiver_id" ),
                                   required_amount( args, "amount" ) );
    case ft_instruction::ft_balance_of:
    case ft_instruction::storage_balance_of:
      return protocol::encode_all( instruction, required_string( args, "account_id" ) );
    case ft_instruction::storage_deposit:
      return protocol::encode_all( instruction,
                                   optional_string( args, "account_id" ),
                                   optional_bool( args, "registration_only" ) );
    case ft_instruction::storage_withdraw:
      return protocol::encode_all( instruction, optional_amount( args, "amount" ) );
    case ft_instruction::storage_unregister:
      return protocol::encode_all( instruction, optional_bool( args, "force" ) );
    case ft_instruction::ft_total_supply:
    case ft_instruction::ft_metadata:
    case ft_instruction::storage_balance_bounds:
      return protocol::encode_all( instruction );
  }

  std::unreachable();
}

nlohmann::ordered_json decode_result( const std::string& method, std::span< const std::byte > output )
{
  auto instruction = find_method( method );
  nlohmann::ordered_json malformed;
  malformed[ "raw" ] = encode::to_base64( output );

  switch( instruction )
  {
    case ft_instruction::ft_total_supply:
    case ft_instruction::ft_transfer_call:
    case ft_instruction::ft_resolve_transfer:
      if( auto amount = decode< protocol::amount_t >( output ); amount )
        return amount->str();
      return malformed;
    case ft_instruction::ft_balance_of:
      if( auto amount = decode< std::optional< protocol::amount_t > >( output ); amount )
        return *amount ? nlohmann::ordered_json( ( *amount )->str() ) : nlohmann::ordered_json();
      return malformed;
    case ft_instruction::ft_metadata:
      if( auto metadata = decode< protocol::token_metadata >( output ); metadata )
        return metadata_to_json( *metadata );
      return malformed;
    case ft_instruction::storage_deposit:
    case ft_instruction::storage_withdraw:
      if( auto balance = decode< protocol::storage_balance >( output ); balance )
        return storage_balance_to_json( *balance );
      return malformed;
    case ft_instruction::storage_balance_of:
      if( auto balance = decode< std::optional< protocol::storage_balance > >( output ); balance )
        return *balance ? storage_balance_to_json( **balance ) : nlohmann::ordered_json();
      return malformed;
    case ft_instruction::storage_balance_bounds:
      if( auto bounds = decode< protocol::storage_balance_bounds >( output ); bounds )
      {
        nlohmann::ordered_json value;
        value[ "min" ] = bounds->min.str();
        value[ "max" ] = bounds->max ? nlohmann::ordered_json( bounds->max->str() ) : nlohmann::ordered_json();
        return value;
      }
      return malformed;
    case ft_instruction::storage_unregister:
      if( auto closed = decode< bool >( output ); closed )
        return *closed;
      return malformed;
    case ft_instruction::initialize:
    case ft_instruction::initialize_default_metadata:
    case ft_instruction::ft_transfer:
      break;
  }

  return nullptr;
}

nlohmann::ordered_json to_json( const std::string& method, const protocol::transaction_receipt& receipt )
{
  nlohmann::ordered_json value;
  value[ "method" ] = method;
  value[ "status" ] = receipt.successful() ? "success" : "failure";

  if( receipt.successful() )
    value[ "result" ] = decode_result( method, receipt.output );
  else
    value[ "error" ] = receipt.error.message();

  value[ "events" ]   = nlohmann::ordered_json::array();
  value[ "warnings" ] = nlohmann::ordered_json::array();

  protocol::gas_t gas_burnt = 0;

  for( const auto& outcome: receipt.outcomes )
  {
    for( const auto& event: outcome.events )
      value[ "events" ].push_back( event.to_json() );

    for( const auto& warning: outcome.warnings )
      value[ "warnings" ].push_back( warning.message() );

    gas_burnt += outcome.gas_burnt;
  }

  value[ "logs" ]      = receipt.log_lines();
  value[ "receipts" ]  = receipt.outcomes.size();
  value[ "gas_burnt" ] = gas_burnt;
  return value;
}

} // namespace fungible::cli
