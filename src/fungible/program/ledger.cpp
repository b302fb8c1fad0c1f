#include <fungible/program/events.hpp>
#include <fungible/program/ledger.hpp>

#include <limits>

#include <boost/endian.hpp>

namespace fungible::program {

static std::error_code write_status( const result< std::int64_t >& written )
{
  if( !written )
    return written.error();

  return program_errc::ok;
}

ledger::ledger( system_interface* system ) noexcept:
    _system( system )
{}

bool ledger::initialized()
{
  return !_system->get_object( space::metadata, memory::as_bytes( key::total_supply ) ).empty();
}

result< protocol::amount_t > ledger::total_supply()
{
  auto object = _system->get_object( space::metadata, memory::as_bytes( key::total_supply ) );
  if( object.empty() )
    return std::unexpected( program_errc::not_initialized );

  protocol::amount_t supply = 0;
  protocol::decoder decoder( object );
  if( decoder.read( supply ) )
    return std::unexpected( program_errc::unexpected_object );

  return supply;
}

std::error_code ledger::set_total_supply( const protocol::amount_t& supply )
{
  auto object = protocol::encode_all( supply );
  return write_status( _system->put_object( space::metadata, memory::as_bytes( key::total_supply ), object ) );
}

result< protocol::token_metadata > ledger::metadata()
{
  auto object = _system->get_object( space::metadata, memory::as_bytes( key::metadata ) );
  if( object.empty() )
    return std::unexpected( program_errc::not_initialized );

  protocol::token_metadata metadata;
  protocol::decoder decoder( object );
  if( decoder.read( metadata ) )
    return std::unexpected( program_errc::unexpected_object );

  return metadata;
}

std::error_code ledger::set_metadata( const protocol::token_metadata& metadata )
{
  auto object = protocol::encode_all( metadata );
  return write_status( _system->put_object( space::metadata, memory::as_bytes( key::metadata ), object ) );
}

result< std::uint64_t > ledger::account_storage_usage()
{
  auto object = _system->get_object( space::metadata, memory::as_bytes( key::account_storage_usage ) );
  if( object.empty() )
    return std::unexpected( program_errc::not_initialized );

  if( object.size() != sizeof( std::uint64_t ) )
    return std::unexpected( program_errc::unexpected_object );

  auto usage = memory::bit_cast< std::uint64_t >( object );
  boost::endian::little_to_native_inplace( usage );
  return usage;
}

std::error_code ledger::set_account_storage_usage( std::uint64_t usage )
{
  boost::endian::native_to_little_inplace( usage );
  return write_status(
    _system->put_object( space::metadata, memory::as_bytes( key::account_storage_usage ), memory::as_bytes( usage ) ) );
}

result< std::optional< protocol::amount_t > > ledger::balance_of( std::string_view account )
{
  auto object = _system->get_object( space::accounts, memory::as_bytes( account ) );
  if( object.empty() )
    return std::optional< protocol::amount_t >{};

  protocol::amount_t balance = 0;
  protocol::decoder decoder( object );
  if( decoder.read( balance ) )
    return std::unexpected( program_errc::unexpected_object );

  return balance;
}

result< protocol::amount_t > ledger::unwrap_balance_of( std::string_view account )
{
  auto balance = balance_of( account );
  if( !balance )
    return std::unexpected( balance.error() );

  if( !balance->has_value() )
    return std::unexpected( program_errc::not_registered );

  return **balance;
}

result< bool > ledger::registered( std::string_view account )
{
  return balance_of( account ).transform(
    []( const auto& balance )
    {
      return balance.has_value();
    } );
}

result< std::int64_t > ledger::register_account( std::string_view account )
{
  auto is_registered = registered( account );
  if( !is_registered )
    return std::unexpected( is_registered.error() );

  if( *is_registered )
    return std::unexpected( program_errc::unexpected_object );

  auto object = protocol::encode_all( protocol::amount_t( 0 ) );
  return _system->put_object( space::accounts, memory::as_bytes( account ), object );
}

std::error_code ledger::unregister_account( std::string_view account )
{
  auto is_registered = registered( account );
  if( !is_registered )
    return is_registered.error();

  if( !*is_registered )
    return program_errc::not_registered;

  return write_status( _system->remove_object( space::accounts, memory::as_bytes( account ) ) );
}

std::error_code ledger::put_balance( std::string_view account, const protocol::amount_t& balance )
{
  auto object = protocol::encode_all( balance );
  return write_status( _system->put_object( space::accounts, memory::as_bytes( account ), object ) );
}

result< protocol::amount_t > ledger::checked_deposit( const protocol::amount_t& balance,
                                                      const protocol::amount_t& amount )
{
  if( std::numeric_limits< protocol::amount_t >::max() - balance < amount )
    return std::unexpected( program_errc::overflow );

  auto supply = total_supply();
  if( !supply )
    return std::unexpected( supply.error() );

  protocol::amount_t new_balance = balance + amount;

  // No balance may exceed the fixed total supply
  if( new_balance > *supply )
    return std::unexpected( program_errc::overflow );

  return new_balance;
}

std::error_code ledger::internal_withdraw( std::string_view account, const protocol::amount_t& amount )
{
  auto balance = unwrap_balance_of( account );
  if( !balance )
    return balance.error();

  if( *balance < amount )
    return program_errc::insufficient_balance;

  return put_balance( account, *balance - amount );
}

std::error_code ledger::internal_deposit( std::string_view account, const protocol::amount_t& amount )
{
  auto balance = unwrap_balance_of( account );
  if( !balance )
    return balance.error();

  auto new_balance = checked_deposit( *balance, amount );
  if( !new_balance )
    return new_balance.error();

  return put_balance( account, *new_balance );
}

std::error_code ledger::internal_transfer( std::string_view sender,
                                           std::string_view receiver,
                                           const protocol::amount_t& amount,
                                           const std::optional< std::string >& memo )
{
  if( sender == receiver )
    return program_errc::self_transfer;

  auto receiver_balance = balance_of( receiver );
  if( !receiver_balance )
    return receiver_balance.error();

  if( !receiver_balance->has_value() )
    return program_errc::receiver_not_registered;

  if( amount == 0 )
    return program_errc::zero_amount;

  auto sender_balance = unwrap_balance_of( sender );
  if( !sender_balance )
    return sender_balance.error();

  if( *sender_balance < amount )
    return program_errc::insufficient_balance;

  auto new_receiver_balance = checked_deposit( **receiver_balance, amount );
  if( !new_receiver_balance )
    return new_receiver_balance.error();

  if( auto error = put_balance( sender, *sender_balance - amount ); error )
    return error;

  if( auto error = put_balance( receiver, *new_receiver_balance ); error )
    return error;

  return events::ft_transfer( _system, sender, receiver, amount, memo );
}

} // namespace fungible::program
