// NOLINTBEGIN

#include <test/fixture.hpp>

#include <fungible/controller.hpp>
#include <fungible/log.hpp>
#include <fungible/protocol.hpp>

namespace test {

fungible::protocol::amount_t near( std::uint64_t n )
{
  static const fungible::protocol::amount_t unit =
    fungible::protocol::amount_t( 1'000'000'000'000ull ) * fungible::protocol::amount_t( 1'000'000'000'000ull );
  return fungible::protocol::amount_t( n ) * unit;
}

fixture::fixture( const std::string& name, const std::string& log_level )
{
  fungible::log::initialize();
  fungible::log::set_level( log_level );

  LOG_INFO( fungible::log::instance(), "Starting fixture: {}", name );

  _controller = std::make_unique< fungible::controller::controller >();

  for( const auto& id: { account::token, account::owner, account::alice, account::bob, account::receiver, account::plain } )
    _genesis_data.emplace_back( fungible::controller::state::genesis_entry{ .id = id, .balance = near( 1'000 ) } );

  _controller->open( _genesis_data );

  if( auto error = _controller->deploy( account::token, std::make_shared< fungible::program::fungible_token >() );
      error )
    throw std::runtime_error( "unable to deploy token: " + error.message() );

  if( auto error = _controller->deploy( account::receiver, std::make_shared< test::receiver >() ); error )
    throw std::runtime_error( "unable to deploy receiver: " + error.message() );
}

fixture::~fixture()
{
  _controller->close();
}

fungible::protocol::transaction fixture::make_transaction( const fungible::protocol::account_id& signer,
                                                           const fungible::protocol::account_id& receiver,
                                                           std::vector< std::byte >&& input,
                                                           const fungible::protocol::amount_t& deposit,
                                                           fungible::protocol::gas_t gas ) const
{
  fungible::protocol::transaction t;
  t.signer   = signer;
  t.receiver = receiver;
  t.input    = std::move( input );
  t.deposit  = deposit;
  t.gas      = gas;
  return t;
}

fungible::controller::result< fungible::protocol::transaction_receipt >
fixture::call( const fungible::protocol::account_id& signer,
               std::vector< std::byte >&& input,
               const fungible::protocol::amount_t& deposit,
               fungible::protocol::gas_t gas )
{
  return _controller->process( make_transaction( signer, account::token, std::move( input ), deposit, gas ) );
}

fungible::controller::result< fungible::protocol::transaction_receipt >
fixture::initialize_token( const fungible::protocol::account_id& owner, const fungible::protocol::amount_t& supply )
{
  return call( account::token,
               make_input( fungible::protocol::ft_instruction::initialize_default_metadata, owner, supply ) );
}

fungible::controller::result< fungible::protocol::transaction_receipt >
fixture::storage_deposit( const fungible::protocol::account_id& payer,
                          const std::optional< fungible::protocol::account_id >& account,
                          const fungible::protocol::amount_t& deposit )
{
  return call( payer,
               make_input( fungible::protocol::ft_instruction::storage_deposit, account, std::optional< bool >{} ),
               deposit );
}

fungible::controller::result< fungible::protocol::transaction_receipt >
fixture::ft_transfer( const fungible::protocol::account_id& sender,
                      const fungible::protocol::account_id& receiver,
                      const fungible::protocol::amount_t& amount,
                      const std::optional< std::string >& memo )
{
  return call( sender, make_input( fungible::protocol::ft_instruction::ft_transfer, receiver, amount, memo ), one_yocto );
}

fungible::controller::result< fungible::protocol::transaction_receipt >
fixture::ft_transfer_call( const fungible::protocol::account_id& sender,
                           const fungible::protocol::account_id& receiver,
                           const fungible::protocol::amount_t& amount,
                           const std::string& msg,
                           fungible::protocol::gas_t gas,
                           const std::optional< std::string >& memo )
{
  return call( sender,
               make_input( fungible::protocol::ft_instruction::ft_transfer_call, receiver, amount, memo, msg ),
               one_yocto,
               gas );
}

std::optional< fungible::protocol::amount_t > fixture::balance_of( const fungible::protocol::account_id& account ) const
{
  auto output =
    _controller->read_program( account::token, make_input( fungible::protocol::ft_instruction::ft_balance_of, account ) );
  if( !output )
    throw std::runtime_error( "ft_balance_of failed: " + output.error().message() );

  auto balance = decode_output< std::optional< fungible::protocol::amount_t > >( *output );
  if( !balance )
    throw std::runtime_error( "ft_balance_of returned a malformed result" );

  return *balance;
}

fungible::protocol::amount_t fixture::total_supply() const
{
  auto output =
    _controller->read_program( account::token, make_input( fungible::protocol::ft_instruction::ft_total_supply ) );
  if( !output )
    throw std::runtime_error( "ft_total_supply failed: " + output.error().message() );

  return decode_output< fungible::protocol::amount_t >( *output ).value();
}

fungible::protocol::amount_t fixture::storage_bond() const
{
  auto output = _controller->read_program( account::token,
                                           make_input( fungible::protocol::ft_instruction::storage_balance_bounds ) );
  if( !output )
    throw std::runtime_error( "storage_balance_bounds failed: " + output.error().message() );

  return decode_output< fungible::protocol::storage_balance_bounds >( *output ).value().min;
}

fungible::protocol::amount_t fixture::native_balance( const fungible::protocol::account_id& account ) const
{
  return _controller->account_balance( account ).value();
}

bool fixture::verify( const fungible::controller::result< fungible::protocol::transaction_receipt >& receipt,
                      std::uint64_t flags ) const
{
  if( flags == verification::none )
    return true;

  if( !receipt.has_value() )
  {
    LOG_ERROR( fungible::log::instance(), "Transaction submission has failed with: {}", receipt.error().message() );
    return false;
  }

  for( const auto& outcome: receipt->outcomes )
  {
    if( ( flags & verification::without_failure ) && !outcome.successful() )
    {
      LOG_ERROR( fungible::log::instance(),
                 "Receipt {} to {} failed with: {}",
                 outcome.id,
                 outcome.receiver,
                 outcome.error.message() );
      return false;
    }

    if( ( flags & verification::without_warning ) && !outcome.warnings.empty() )
    {
      LOG_ERROR( fungible::log::instance(),
                 "Receipt {} to {} reported warning: {}",
                 outcome.id,
                 outcome.receiver,
                 outcome.warnings.front().message() );
      return false;
    }
  }

  return true;
}

} // namespace test

// NOLINTEND
