// NOLINTBEGIN

#include <test/mock_system.hpp>

#include <algorithm>

namespace test {

mock_system::mock_system( fungible::protocol::account_id current_account ):
    current( std::move( current_account ) ),
    caller( current )
{}

void mock_system::prepare( fungible::protocol::account_id account,
                           std::vector< std::byte >&& call_input,
                           const fungible::protocol::amount_t& attached,
                           fungible::protocol::gas_t gas )
{
  caller       = std::move( account );
  input        = std::move( call_input );
  input_offset = 0;
  deposit      = attached;
  prepaid      = gas;
  used         = 0;

  output.clear();
  events.clear();
  logs.clear();
  warnings.clear();
  transfers.clear();
  promises.clear();
  returned.reset();
}

std::span< const std::string > mock_system::arguments()
{
  return {};
}

std::error_code mock_system::write( fungible::program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != fungible::program::file_descriptor::stdout )
    return fungible::program::program_errc::invalid_argument;

  output.insert( output.end(), buffer.begin(), buffer.end() );
  return fungible::program::program_errc::ok;
}

std::error_code mock_system::read( fungible::program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != fungible::program::file_descriptor::stdin || buffer.size() > input.size() - input_offset )
    return fungible::protocol::protocol_errc::unexpected_end_of_input;

  std::ranges::copy( input.data() + input_offset, input.data() + input_offset + buffer.size(), buffer.data() );
  input_offset += buffer.size();
  return fungible::program::program_errc::ok;
}

std::span< const std::byte > mock_system::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  auto itr = objects.find( { id, std::vector( key.begin(), key.end() ) } );
  if( itr == objects.end() )
    return {};

  return itr->second;
}

fungible::program::result< std::int64_t >
mock_system::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  auto& object = objects[ { id, std::vector( key.begin(), key.end() ) } ];

  std::int64_t delta = object.empty() ? std::ssize( key ) + std::ssize( value ) : std::ssize( value ) - std::ssize( object );
  object.assign( value.begin(), value.end() );
  return delta;
}

fungible::program::result< std::int64_t > mock_system::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  auto itr = objects.find( { id, std::vector( key.begin(), key.end() ) } );
  if( itr == objects.end() )
    return 0;

  std::int64_t delta = -std::ssize( key ) - std::ssize( itr->second );
  objects.erase( itr );
  return delta;
}

const fungible::protocol::account_id& mock_system::current_account()
{
  return current;
}

const fungible::protocol::account_id& mock_system::get_caller()
{
  return caller;
}

const fungible::protocol::account_id& mock_system::get_signer()
{
  return caller;
}

fungible::protocol::amount_t mock_system::attached_deposit()
{
  return deposit;
}

fungible::protocol::amount_t mock_system::storage_byte_cost()
{
  return byte_cost;
}

fungible::protocol::gas_t mock_system::prepaid_gas()
{
  return prepaid;
}

fungible::protocol::gas_t mock_system::used_gas()
{
  return used;
}

std::error_code mock_system::use_gas( fungible::protocol::gas_t gas )
{
  used += gas;
  return fungible::program::program_errc::ok;
}

std::error_code mock_system::emit_event( fungible::protocol::event event )
{
  event.source = current;
  events.emplace_back( std::move( event ) );
  return fungible::program::program_errc::ok;
}

std::error_code mock_system::log( std::string_view message )
{
  logs.emplace_back( message );
  return fungible::program::program_errc::ok;
}

void mock_system::warn( std::error_code warning )
{
  warnings.push_back( warning );
}

std::error_code mock_system::transfer( const fungible::protocol::account_id& to, const fungible::protocol::amount_t& amount )
{
  transfers.emplace_back( to, amount );
  return fungible::program::program_errc::ok;
}

fungible::program::result< fungible::program::promise_index >
mock_system::call_program( const fungible::protocol::account_id& account,
                           std::span< const std::byte > call_input,
                           const fungible::protocol::amount_t& attached,
                           fungible::protocol::gas_t gas )
{
  promises.push_back( { account, std::vector( call_input.begin(), call_input.end() ), attached, gas, std::nullopt } );
  return promises.size() - 1;
}

fungible::program::result< fungible::program::promise_index >
mock_system::then( fungible::program::promise_index after,
                   const fungible::protocol::account_id& account,
                   std::span< const std::byte > call_input,
                   const fungible::protocol::amount_t& attached,
                   fungible::protocol::gas_t gas )
{
  promises.push_back( { account, std::vector( call_input.begin(), call_input.end() ), attached, gas, after } );
  return promises.size() - 1;
}

std::error_code mock_system::promise_return( fungible::program::promise_index index )
{
  returned = index;
  return fungible::program::program_errc::ok;
}

std::uint64_t mock_system::promise_results_count()
{
  return promise_results.size();
}

fungible::program::result< fungible::protocol::promise_result > mock_system::promise_result( std::uint64_t index )
{
  if( index >= promise_results.size() )
    return std::unexpected( fungible::program::program_errc::invalid_argument );

  return promise_results[ index ];
}

} // namespace test

// NOLINTEND
