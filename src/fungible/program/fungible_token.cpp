#include <fungible/program/events.hpp>
#include <fungible/program/fungible_token.hpp>
#include <fungible/program/metadata.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace fungible::program {

static constexpr protocol::amount_t one_yocto = 1;

static constexpr std::string_view initial_mint_memo    = "Initial tokens supply is minted";
static constexpr std::string_view refund_memo          = "refund";
static constexpr std::string_view force_unregister_memo = "force unregister";

template< typename... Args >
static std::error_code write_output( system_interface* system, const Args&... args )
{
  auto output = protocol::encode_all( args... );
  return system->write( file_descriptor::stdout, output );
}

static std::error_code assert_one_yocto( system_interface* system )
{
  if( system->attached_deposit() != one_yocto )
    return program_errc::requires_one_yocto;

  return program_errc::ok;
}

static std::error_code assert_no_deposit( system_interface* system )
{
  if( system->attached_deposit() != 0 )
    return program_errc::deposit_not_accepted;

  return program_errc::ok;
}

static bool valid_memo( const std::optional< std::string >& memo ) noexcept
{
  return !memo || protocol::valid_utf8( std::string_view( *memo ) );
}

template< typename... Args >
static std::error_code read_arguments( protocol::decoder& input, Args&... args )
{
  if( input.read_all( args... ) )
    return program_errc::invalid_argument;

  return program_errc::ok;
}

std::error_code fungible_token::run( system_interface* system, const std::span< const std::string > arguments )
{
  protocol::decoder input(
    [ system ]( std::span< std::byte > buffer )
    {
      return system->read( file_descriptor::stdin, buffer );
    } );

  std::uint32_t instruction = 0;
  if( input.read( instruction ) )
    return program_errc::invalid_instruction;

  ledger state( system );

  if( instruction == std::to_underlying( protocol::ft_instruction::initialize ) )
    return initialize( system, state, input, false );

  if( instruction == std::to_underlying( protocol::ft_instruction::initialize_default_metadata ) )
    return initialize( system, state, input, true );

  if( !state.initialized() )
    return program_errc::not_initialized;

  switch( instruction )
  {
    case std::to_underlying( protocol::ft_instruction::ft_transfer ):
      return ft_transfer( system, state, input );
    case std::to_underlying( protocol::ft_instruction::ft_transfer_call ):
      return ft_transfer_call( system, state, input );
    case std::to_underlying( protocol::ft_instruction::ft_resolve_transfer ):
      return ft_resolve_transfer( system, state, input );
    case std::to_underlying( protocol::ft_instruction::ft_total_supply ):
      return ft_total_supply( system, state );
    case std::to_underlying( protocol::ft_instruction::ft_balance_of ):
      return ft_balance_of( system, state, input );
    case std::to_underlying( protocol::ft_instruction::ft_metadata ):
      return ft_metadata( system, state );
    case std::to_underlying( protocol::ft_instruction::storage_deposit ):
      return storage_deposit( system, state, input );
    case std::to_underlying( protocol::ft_instruction::storage_withdraw ):
      return storage_withdraw( system, state, input );
    case std::to_underlying( protocol::ft_instruction::storage_unregister ):
      return storage_unregister( system, state, input );
    case std::to_underlying( protocol::ft_instruction::storage_balance_bounds ):
      return storage_balance_bounds( system, state );
    case std::to_underlying( protocol::ft_instruction::storage_balance_of ):
      return storage_balance_of( system, state, input );
    default:
      break;
  }

  return program_errc::invalid_instruction;
}

std::error_code
fungible_token::initialize( system_interface* system, ledger& state, protocol::decoder& input, bool default_meta )
{
  if( state.initialized() )
    return program_errc::already_initialized;

  if( system->get_caller() != system->current_account() )
    return program_errc::unauthorized;

  if( auto error = assert_no_deposit( system ); error )
    return error;

  protocol::account_id owner;
  protocol::amount_t supply = 0;
  protocol::token_metadata metadata;

  if( default_meta )
  {
    if( auto error = read_arguments( input, owner, supply ); error )
      return error;

    metadata = default_metadata();
  }
  else if( auto error = read_arguments( input, owner, supply, metadata ); error )
    return error;

  if( !protocol::valid_account_id( owner ) )
    return program_errc::invalid_argument;

  if( auto error = validate( metadata ); error )
    return error;

  // Measure the footprint of the longest possible ledger entry
  const std::string longest_account( protocol::max_account_id_length, 'a' );

  auto usage = state.register_account( longest_account );
  if( !usage )
    return usage.error();

  if( *usage <= 0 )
    return program_errc::unexpected_object;

  if( auto error = state.unregister_account( longest_account ); error )
    return error;

  if( auto error = state.set_account_storage_usage( static_cast< std::uint64_t >( *usage ) ); error )
    return error;

  if( auto error = state.set_total_supply( supply ); error )
    return error;

  if( auto error = state.set_metadata( metadata ); error )
    return error;

  if( auto registered = state.register_account( owner ); !registered )
    return registered.error();

  // The contract holds the balances of accounts that were force unregistered
  if( owner != system->current_account() )
  {
    if( auto registered = state.register_account( system->current_account() ); !registered )
      return registered.error();
  }

  if( auto error = state.internal_deposit( owner, supply ); error )
    return error;

  return events::ft_mint( system, owner, supply, std::string( initial_mint_memo ) );
}

std::error_code fungible_token::ft_transfer( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_one_yocto( system ); error )
    return error;

  protocol::account_id receiver;
  protocol::amount_t amount = 0;
  std::optional< std::string > memo;

  if( auto error = read_arguments( input, receiver, amount, memo ); error )
    return error;

  if( !protocol::valid_account_id( receiver ) || !valid_memo( memo ) )
    return program_errc::invalid_argument;

  return state.internal_transfer( system->get_caller(), receiver, amount, memo );
}

std::error_code fungible_token::ft_transfer_call( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_one_yocto( system ); error )
    return error;

  protocol::account_id receiver;
  protocol::amount_t amount = 0;
  std::optional< std::string > memo;
  std::string msg;

  if( auto error = read_arguments( input, receiver, amount, memo, msg ); error )
    return error;

  if( !protocol::valid_account_id( receiver ) || !valid_memo( memo ) || msg.empty() )
    return program_errc::invalid_argument;

  auto prepaid_gas = system->prepaid_gas();
  if( prepaid_gas <= gas_for_ft_transfer_call )
    return program_errc::insufficient_gas;

  const auto sender = system->get_caller();

  if( auto error = state.internal_transfer( sender, receiver, amount, memo ); error )
    return error;

  auto notification =
    protocol::encode_all( protocol::ft_receiver_instruction::ft_on_transfer, sender, amount, msg );

  auto notified = system->call_program( receiver, notification, 0, prepaid_gas - gas_for_ft_transfer_call );
  if( !notified )
    return notified.error();

  auto resolution = protocol::encode_all( protocol::ft_instruction::ft_resolve_transfer, sender, receiver, amount );

  auto resolved = system->then( *notified, system->current_account(), resolution, 0, gas_for_resolve_transfer );
  if( !resolved )
    return resolved.error();

  return system->promise_return( *resolved );
}

std::error_code fungible_token::ft_resolve_transfer( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( system->get_caller() != system->current_account() )
    return program_errc::unauthorized;

  if( auto error = assert_no_deposit( system ); error )
    return error;

  protocol::account_id sender;
  protocol::account_id receiver;
  protocol::amount_t amount = 0;

  if( auto error = read_arguments( input, sender, receiver, amount ); error )
    return error;

  // A failed or malformed notification leaves the whole amount unused
  protocol::amount_t unused = amount;

  if( system->promise_results_count() == 1 )
  {
    auto notification = system->promise_result( 0 );
    if( !notification )
      return notification.error();

    if( notification->successful() )
    {
      protocol::amount_t used = 0;
      protocol::decoder decoder( notification->data );

      if( !decoder.read( used ) )
        unused = amount - std::min( used, amount );
    }
  }

  protocol::amount_t refund = 0;

  if( unused > 0 )
  {
    auto receiver_balance = state.balance_of( receiver );
    if( !receiver_balance )
      return receiver_balance.error();

    refund = std::min( unused, receiver_balance->value_or( 0 ) );

    if( refund < unused )
    {
      system->warn( program_errc::refund_truncated );

      if( auto error = system->log( std::format( "Refund truncated from {} to {}", unused.str(), refund.str() ) );
          error )
        return error;
    }

    if( refund > 0 )
    {
      auto sender_registered = state.registered( sender );
      if( !sender_registered )
        return sender_registered.error();

      const auto& refund_target = *sender_registered ? sender : system->current_account();

      if( refund_target != receiver )
      {
        if( auto error = state.internal_transfer( receiver, refund_target, refund, std::string( refund_memo ) );
            error )
          return error;
      }
    }
  }

  return write_output( system, amount - refund );
}

std::error_code fungible_token::ft_total_supply( system_interface* system, ledger& state )
{
  if( auto error = assert_no_deposit( system ); error )
    return error;

  auto supply = state.total_supply();
  if( !supply )
    return supply.error();

  return write_output( system, *supply );
}

std::error_code fungible_token::ft_balance_of( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_no_deposit( system ); error )
    return error;

  protocol::account_id account;
  if( auto error = read_arguments( input, account ); error )
    return error;

  auto balance = state.balance_of( account );
  if( !balance )
    return balance.error();

  return write_output( system, *balance );
}

std::error_code fungible_token::ft_metadata( system_interface* system, ledger& state )
{
  if( auto error = assert_no_deposit( system ); error )
    return error;

  auto metadata = state.metadata();
  if( !metadata )
    return metadata.error();

  return write_output( system, *metadata );
}

result< protocol::amount_t > fungible_token::storage_bond( system_interface* system, ledger& state )
{
  return state.account_storage_usage().and_then(
    [ system ]( std::uint64_t usage ) -> result< protocol::amount_t >
    {
      auto cost = system->storage_byte_cost();
      if( usage != 0 && cost > std::numeric_limits< protocol::amount_t >::max() / usage )
        return std::unexpected( program_errc::overflow );

      return protocol::amount_t( usage ) * cost;
    } );
}

std::error_code fungible_token::storage_deposit( system_interface* system, ledger& state, protocol::decoder& input )
{
  std::optional< protocol::account_id > account_arg;
  std::optional< bool > registration_only;

  if( auto error = read_arguments( input, account_arg, registration_only ); error )
    return error;

  const auto& caller  = system->get_caller();
  const auto& account = account_arg ? *account_arg : caller;

  if( !protocol::valid_account_id( account ) )
    return program_errc::invalid_argument;

  auto amount = system->attached_deposit();

  auto bond = storage_bond( system, state );
  if( !bond )
    return bond.error();

  auto is_registered = state.registered( account );
  if( !is_registered )
    return is_registered.error();

  if( *is_registered )
  {
    if( auto error = system->log( "The account is already registered, refunding the deposit" ); error )
      return error;

    if( amount > 0 )
    {
      if( auto error = system->transfer( caller, amount ); error )
        return error;
    }
  }
  else
  {
    if( amount < *bond )
      return program_errc::insufficient_deposit;

    if( auto registered = state.register_account( account ); !registered )
      return registered.error();

    // The bound maximum equals the minimum so registration_only changes nothing
    if( auto refund = amount - *bond; refund > 0 )
    {
      if( auto error = system->transfer( caller, refund ); error )
        return error;
    }
  }

  return write_output( system, protocol::storage_balance{ .total = *bond, .available = 0 } );
}

std::error_code fungible_token::storage_withdraw( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_one_yocto( system ); error )
    return error;

  std::optional< protocol::amount_t > amount;
  if( auto error = read_arguments( input, amount ); error )
    return error;

  auto is_registered = state.registered( system->get_caller() );
  if( !is_registered )
    return is_registered.error();

  if( !*is_registered )
    return program_errc::not_registered;

  if( amount && *amount > 0 )
    return program_errc::insufficient_storage_balance;

  auto bond = storage_bond( system, state );
  if( !bond )
    return bond.error();

  return write_output( system, protocol::storage_balance{ .total = *bond, .available = 0 } );
}

std::error_code fungible_token::storage_unregister( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_one_yocto( system ); error )
    return error;

  std::optional< bool > force;
  if( auto error = read_arguments( input, force ); error )
    return error;

  const auto& account = system->get_caller();

  if( account == system->current_account() )
    return program_errc::unauthorized;

  auto balance = state.balance_of( account );
  if( !balance )
    return balance.error();

  if( !balance->has_value() )
  {
    if( auto error = system->log( std::format( "The account {} is not registered", account ) ); error )
      return error;

    return write_output( system, false );
  }

  const auto remaining = **balance;

  if( remaining > 0 )
  {
    if( !force.value_or( false ) )
      return program_errc::non_zero_balance;

    if( auto error =
          state.internal_transfer( account, system->current_account(), remaining, std::string( force_unregister_memo ) );
        error )
      return error;
  }

  if( auto error = state.unregister_account( account ); error )
    return error;

  auto bond = storage_bond( system, state );
  if( !bond )
    return bond.error();

  // The attached unit goes back with the bond
  if( *bond == std::numeric_limits< protocol::amount_t >::max() )
    return program_errc::overflow;

  if( auto error = system->transfer( account, *bond + one_yocto ); error )
    return error;

  if( auto error = system->log( std::format( "Closed @{} with {}", account, remaining.str() ) ); error )
    return error;

  return write_output( system, true );
}

std::error_code fungible_token::storage_balance_bounds( system_interface* system, ledger& state )
{
  if( auto error = assert_no_deposit( system ); error )
    return error;

  auto bond = storage_bond( system, state );
  if( !bond )
    return bond.error();

  return write_output( system, protocol::storage_balance_bounds{ .min = *bond, .max = *bond } );
}

std::error_code fungible_token::storage_balance_of( system_interface* system, ledger& state, protocol::decoder& input )
{
  if( auto error = assert_no_deposit( system ); error )
    return error;

  protocol::account_id account;
  if( auto error = read_arguments( input, account ); error )
    return error;

  auto is_registered = state.registered( account );
  if( !is_registered )
    return is_registered.error();

  std::optional< protocol::storage_balance > balance;

  if( *is_registered )
  {
    auto bond = storage_bond( system, state );
    if( !bond )
      return bond.error();

    balance = protocol::storage_balance{ .total = *bond, .available = 0 };
  }

  return write_output( system, balance );
}

} // namespace fungible::program
