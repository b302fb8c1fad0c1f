#include <fungible/controller/controller.hpp>
#include <fungible/controller/execution_context.hpp>
#include <fungible/controller/state.hpp>

#include <fungible/log.hpp>

#include <algorithm>
#include <deque>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <span>
#include <stdexcept>
#include <utility>

namespace fungible::controller {

struct applied_receipt
{
  protocol::receipt_outcome outcome;
  std::vector< std::pair< std::optional< protocol::receipt_id >, protocol::receipt > > created;
};

controller::controller( const state::runtime_config& config ):
    _config( config )
{}

controller::~controller()
{
  close();
}

void controller::open( const state::genesis_data& data )
{
  _db.open(
    [ & ]( state_db::state_node_ptr& root )
    {
      protocol::amount_t circulating = 0;

      for( const auto& entry: data )
      {
        if( !protocol::valid_account_id( entry.id ) )
          throw std::runtime_error( "encountered invalid account in initial state" );

        if( state::native_balance( *root, entry.id ) )
          throw std::runtime_error( "encountered unexpected object in initial state" );

        // Native currency is conserved, so no credit can overflow once the total fits
        if( std::numeric_limits< protocol::amount_t >::max() - circulating < entry.balance )
          throw std::runtime_error( "initial native balances exceed the representable total" );

        circulating += entry.balance;
        state::set_native_balance( *root, entry.id, entry.balance );
      }
      LOG_INFO( fungible::log::instance(), "Wrote {} genesis accounts into new database", data.size() );
    } );
}

void controller::close()
{
  _db.close();
  _programs.clear();
}

std::error_code controller::deploy( const protocol::account_id& account, std::shared_ptr< program::program > program )
{
  if( !_db.is_open() )
    return controller_errc::not_open;

  if( !protocol::valid_account_id( account ) || !program )
    return controller_errc::invalid_account;

  auto root = _db.root();
  if( !state::native_balance( *root, account ) )
    state::set_native_balance( *root, account, 0 );

  _programs.insert_or_assign( account, std::move( program ) );
  LOG_INFO( fungible::log::instance(), "Deployed program on {}", account );

  return controller_errc::ok;
}

void controller::refund( const protocol::account_id& account, const protocol::amount_t& amount )
{
  if( amount == 0 )
    return;

  auto node = _db.root()->make_child();
  if( auto error = state::credit_native_balance( *node, account, amount ); error )
  {
    LOG_WARNING( fungible::log::instance(), "Dropping refund of {} to {}: {}", amount, account, error.message() );
    node->discard();
    return;
  }

  node->squash();
}

applied_receipt controller::apply( const protocol::receipt& receipt )
{
  LOG_DEBUG( fungible::log::instance(),
             "Applying receipt {} from {} to {} with input {}",
             receipt.id,
             receipt.predecessor,
             receipt.receiver,
             fungible::log::base64{ receipt.input.data(), receipt.input.size() } );

  applied_receipt applied;
  auto& outcome       = applied.outcome;
  outcome.id          = receipt.id;
  outcome.predecessor = receipt.predecessor;
  outcome.receiver    = receipt.receiver;

  auto node    = _db.root()->make_child();
  auto balance = state::native_balance( *node, receipt.receiver );
  auto program = _programs.find( receipt.receiver );

  if( !balance )
    outcome.error = controller_errc::account_not_found;
  else if( program == _programs.end() )
    outcome.error = controller_errc::program_not_found;

  if( outcome.error )
  {
    node->discard();
    refund( receipt.predecessor, receipt.deposit );
    LOG_WARNING( fungible::log::instance(),
                 "Receipt {} to {} failed: {}",
                 receipt.id,
                 receipt.receiver,
                 outcome.error.message() );
    return applied;
  }

  outcome.error = state::credit_native_balance( *node, receipt.receiver, receipt.deposit );

  execution_context context( node, receipt, _config, intent::receipt_application );
  if( !outcome.error )
    outcome.error = context.run( *program->second );

  if( outcome.error )
  {
    outcome.gas_burnt = context.gas_meter().burnt();
    node->discard();
    refund( receipt.predecessor, receipt.deposit );
    LOG_WARNING( fungible::log::instance(),
                 "Receipt {} to {} failed: {}",
                 receipt.id,
                 receipt.receiver,
                 outcome.error.message() );
    return applied;
  }

  node->squash();

  outcome.output    = std::move( context.output() );
  outcome.events    = std::move( context.chronicler().events() );
  outcome.logs      = std::move( context.chronicler().logs() );
  outcome.warnings  = std::move( context.chronicler().warnings() );
  outcome.gas_burnt = context.gas_meter().used();

  for( const auto& event: outcome.events )
    LOG_INFO( fungible::log::instance(), "{}", event.to_log_line() );

  auto first_id = _next_receipt_id;
  _next_receipt_id += context.promises().size();

  for( std::size_t i = 0; i < context.promises().size(); ++i )
  {
    auto& promise = context.promises()[ i ];

    protocol::receipt created{ .id          = first_id + i,
                               .predecessor = receipt.receiver,
                               .signer      = receipt.signer,
                               .receiver    = std::move( promise.receiver ),
                               .input       = std::move( promise.input ),
                               .deposit     = promise.deposit,
                               .gas         = promise.gas };

    std::optional< protocol::receipt_id > dependency;
    if( promise.after )
      dependency = first_id + *promise.after;

    applied.created.emplace_back( dependency, std::move( created ) );
  }

  if( context.returned_promise() )
    outcome.forwarded_to = first_id + *context.returned_promise();

  LOG_DEBUG( fungible::log::instance(),
             "Receipt {} applied, {} gas burnt, {} receipt(s) created",
             receipt.id,
             outcome.gas_burnt,
             applied.created.size() );

  return applied;
}

result< protocol::transaction_receipt > controller::process( const protocol::transaction& transaction )
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  if( !protocol::valid_account_id( transaction.signer ) || !protocol::valid_account_id( transaction.receiver ) )
    return std::unexpected( controller_errc::invalid_account );

  if( !transaction.validate() || transaction.gas > _config.max_prepaid_gas )
    return std::unexpected( controller_errc::invalid_gas );

  auto root           = _db.root();
  auto signer_balance = state::native_balance( *root, transaction.signer );
  if( !signer_balance )
    return std::unexpected( controller_errc::account_not_found );

  if( *signer_balance < transaction.deposit )
    return std::unexpected( controller_errc::insufficient_funds );

  state::set_native_balance( *root, transaction.signer, *signer_balance - transaction.deposit );

  LOG_DEBUG( fungible::log::instance(),
             "Pushing transaction from {} to {} with deposit {}",
             transaction.signer,
             transaction.receiver,
             transaction.deposit );

  protocol::receipt first{ .id          = _next_receipt_id++,
                           .predecessor = transaction.signer,
                           .signer      = transaction.signer,
                           .receiver    = transaction.receiver,
                           .input       = transaction.input,
                           .deposit     = transaction.deposit,
                           .gas         = transaction.gas };

  auto first_id = first.id;

  std::deque< protocol::receipt > pending;
  pending.emplace_back( std::move( first ) );

  // Receipts waiting on the outcome of another receipt, keyed by that receipt
  std::map< protocol::receipt_id, std::vector< protocol::receipt > > postponed;

  protocol::transaction_receipt transaction_receipt;

  while( !pending.empty() )
  {
    auto receipt = std::move( pending.front() );
    pending.pop_front();

    auto [ outcome, created ] = apply( receipt );

    for( auto& [ dependency, next ]: created )
    {
      if( dependency )
        postponed[ *dependency ].emplace_back( std::move( next ) );
      else
        pending.emplace_back( std::move( next ) );
    }

    if( auto itr = postponed.find( outcome.id ); itr != postponed.end() )
    {
      auto dependents = std::move( itr->second );
      postponed.erase( itr );

      if( outcome.successful() && outcome.forwarded_to )
      {
        auto& waiting = postponed[ *outcome.forwarded_to ];
        std::ranges::move( dependents, std::back_inserter( waiting ) );
      }
      else
      {
        protocol::promise_result result{ .status = outcome.successful() ? protocol::promise_status::successful
                                                                        : protocol::promise_status::failed,
                                         .data   = outcome.successful() ? outcome.output : std::vector< std::byte >{} };

        for( auto& dependent: dependents )
        {
          dependent.promise_results = { result };
          pending.emplace_back( std::move( dependent ) );
        }
      }
    }

    transaction_receipt.outcomes.emplace_back( std::move( outcome ) );
  }

  for( const auto& [ id, dependents ]: postponed )
    for( const auto& dependent: dependents )
    {
      LOG_WARNING( fungible::log::instance(),
                   "Dropping receipt {} to {} waiting on unresolved receipt {}",
                   dependent.id,
                   dependent.receiver,
                   id );
      refund( dependent.predecessor, dependent.deposit );
    }

  auto result_id = first_id;
  while( const auto* outcome = transaction_receipt.find( result_id ) )
  {
    if( outcome->successful() && outcome->forwarded_to )
    {
      result_id = *outcome->forwarded_to;
      continue;
    }

    transaction_receipt.error  = outcome->error;
    transaction_receipt.output = outcome->output;
    break;
  }

  LOG_DEBUG( fungible::log::instance(),
             "Transaction from {} to {} processed in {} receipt(s)",
             transaction.signer,
             transaction.receiver,
             transaction_receipt.outcomes.size() );

  return transaction_receipt;
}

result< std::vector< std::byte > > controller::read_program( const protocol::account_id& account,
                                                             std::span< const std::byte > input ) const
{
  if( !_db.is_open() )
    return std::unexpected( controller_errc::not_open );

  auto node = _db.root()->make_child();
  if( !state::native_balance( *node, account ) )
    return std::unexpected( controller_errc::account_not_found );

  auto program = _programs.find( account );
  if( program == _programs.end() )
    return std::unexpected( controller_errc::program_not_found );

  protocol::receipt receipt{ .id          = 0,
                             .predecessor = account,
                             .signer      = account,
                             .receiver    = account,
                             .input       = std::vector( input.begin(), input.end() ),
                             .deposit     = 0,
                             .gas         = _config.view_gas };

  execution_context context( node, receipt, _config, intent::read_only );
  auto error = context.run( *program->second );
  node->discard();

  if( error )
    return std::unexpected( error );

  return std::move( context.output() );
}

std::optional< protocol::amount_t > controller::account_balance( const protocol::account_id& account ) const
{
  if( !_db.is_open() )
    return {};

  return state::native_balance( *_db.root(), account );
}

const state::runtime_config& controller::config() const noexcept
{
  return _config;
}

} // namespace fungible::controller
