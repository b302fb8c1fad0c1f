#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include <fungible/controller/execution_context.hpp>
#include <fungible/log.hpp>
#include <fungible/memory.hpp>

namespace fungible::controller {

constexpr auto event_name_limit = 128;

execution_context::execution_context( const state_db::state_node_ptr& node,
                                      const protocol::receipt& receipt,
                                      const state::runtime_config& config,
                                      intent i ):
    _state_node( node ),
    _receipt( receipt ),
    _config( config ),
    _intent( i ),
    _gas_meter( receipt.gas, config )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );
}

std::error_code execution_context::run( program::program& program )
{
  if( auto error = _gas_meter.use_gas( _config.receipt_base_cost ); error )
    return error;

  try
  {
    return program.run( this, _arguments );
  }
  catch( const std::exception& e )
  {
    LOG_WARNING( fungible::log::instance(),
                 "Program {} raised an exception on receipt {}: {}",
                 _receipt.receiver,
                 _receipt.id,
                 std::string( e.what() ) );
  }

  return controller_errc::program_exception;
}

class gas_meter& execution_context::gas_meter() noexcept
{
  return _gas_meter;
}

class chronicler& execution_context::chronicler() noexcept
{
  return _chronicler;
}

std::vector< std::byte >& execution_context::output() noexcept
{
  return _output;
}

std::vector< pending_promise >& execution_context::promises() noexcept
{
  return _promises;
}

const std::optional< program::promise_index >& execution_context::returned_promise() const noexcept
{
  return _returned_promise;
}

std::span< const std::string > execution_context::arguments()
{
  return _arguments;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( auto error = _gas_meter.use_host_call(); error )
    return error;

  if( fd == program::file_descriptor::stdout )
  {
    _output.insert( _output.end(), buffer.begin(), buffer.end() );
    return controller_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    return log( memory::as_string_view( buffer ) );
  }

  return controller_errc::bad_file_descriptor;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( auto error = _gas_meter.use_host_call(); error )
    return error;

  if( fd != program::file_descriptor::stdin )
    return controller_errc::bad_file_descriptor;

  const auto& input = _receipt.input;
  if( buffer.size() > input.size() - _input_offset )
    return controller_errc::unexpected_end_of_input;

  std::ranges::copy( input.data() + _input_offset, input.data() + _input_offset + buffer.size(), buffer.data() );
  _input_offset += buffer.size();
  return controller_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id ) const
{
  return state_db::object_space{ .system = false, .owner = _receipt.receiver, .id = id };
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

program::result< std::int64_t >
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( _intent == intent::read_only )
    return std::unexpected( controller_errc::read_only_context );

  auto delta = _state_node->put( create_object_space( id ), key, value );
  if( auto error = _gas_meter.use_storage_write( delta ); error )
    return std::unexpected( error );

  return delta;
}

program::result< std::int64_t > execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( _intent == intent::read_only )
    return std::unexpected( controller_errc::read_only_context );

  auto delta = _state_node->remove( create_object_space( id ), key );
  if( auto error = _gas_meter.use_storage_write( delta ); error )
    return std::unexpected( error );

  return delta;
}

const protocol::account_id& execution_context::current_account()
{
  return _receipt.receiver;
}

const protocol::account_id& execution_context::get_caller()
{
  return _receipt.predecessor;
}

const protocol::account_id& execution_context::get_signer()
{
  return _receipt.signer;
}

protocol::amount_t execution_context::attached_deposit()
{
  return _receipt.deposit;
}

protocol::amount_t execution_context::storage_byte_cost()
{
  return _config.storage_byte_cost;
}

protocol::gas_t execution_context::prepaid_gas()
{
  return _gas_meter.prepaid();
}

protocol::gas_t execution_context::used_gas()
{
  return _gas_meter.used();
}

std::error_code execution_context::use_gas( protocol::gas_t gas )
{
  return _gas_meter.use_gas( gas );
}

std::error_code execution_context::emit_event( protocol::event event )
{
  if( auto error = _gas_meter.use_host_call(); error )
    return error;

  if( event.name.empty() || event.name.size() > event_name_limit )
    return controller_errc::invalid_event;

  if( !protocol::valid_utf8( std::string_view( event.name ) ) || !protocol::valid_utf8( event.data ) )
    return controller_errc::invalid_event;

  if( event.standard.empty() || event.version.empty() )
    return controller_errc::invalid_event;

  event.source = _receipt.receiver;
  _chronicler.push_event( std::move( event ) );

  return controller_errc::ok;
}

std::error_code execution_context::log( std::string_view message )
{
  if( auto error = _gas_meter.use_host_call(); error )
    return error;

  if( !protocol::valid_utf8( message ) )
    return controller_errc::invalid_log;

  _chronicler.push_log( std::string( message ) );
  return controller_errc::ok;
}

void execution_context::warn( std::error_code warning )
{
  _chronicler.push_warning( warning );
}

std::error_code execution_context::transfer( const protocol::account_id& to, const protocol::amount_t& amount )
{
  if( _intent == intent::read_only )
    return controller_errc::read_only_context;

  if( auto error = _gas_meter.use_host_call(); error )
    return error;

  if( !protocol::valid_account_id( to ) )
    return controller_errc::invalid_account;

  auto to_balance = state::native_balance( *_state_node, to );
  if( !to_balance )
    return controller_errc::account_not_found;

  if( amount == 0 || to == _receipt.receiver )
    return controller_errc::ok;

  auto from_balance = state::native_balance( *_state_node, _receipt.receiver );
  if( !from_balance || *from_balance < amount )
    return controller_errc::insufficient_funds;

  if( std::numeric_limits< protocol::amount_t >::max() - *to_balance < amount )
    return controller_errc::balance_overflow;

  state::set_native_balance( *_state_node, _receipt.receiver, *from_balance - amount );
  state::set_native_balance( *_state_node, to, *to_balance + amount );

  return controller_errc::ok;
}

program::result< program::promise_index > execution_context::create_promise( pending_promise&& promise )
{
  if( _intent == intent::read_only )
    return std::unexpected( controller_errc::read_only_context );

  if( auto error = _gas_meter.use_host_call(); error )
    return std::unexpected( error );

  if( !protocol::valid_account_id( promise.receiver ) )
    return std::unexpected( controller_errc::invalid_account );

  if( promise.after && *promise.after >= _promises.size() )
    return std::unexpected( controller_errc::unknown_promise );

  if( auto error = _gas_meter.reserve( promise.gas ); error )
    return std::unexpected( error );

  if( promise.deposit > 0 )
  {
    auto balance = state::native_balance( *_state_node, _receipt.receiver );
    if( !balance || *balance < promise.deposit )
      return std::unexpected( controller_errc::insufficient_funds );

    state::set_native_balance( *_state_node, _receipt.receiver, *balance - promise.deposit );
  }

  _promises.emplace_back( std::move( promise ) );
  return _promises.size() - 1;
}

program::result< program::promise_index > execution_context::call_program( const protocol::account_id& account,
                                                                           std::span< const std::byte > input,
                                                                           const protocol::amount_t& deposit,
                                                                           protocol::gas_t gas )
{
  return create_promise( pending_promise{ .receiver = account,
                                          .input    = std::vector( input.begin(), input.end() ),
                                          .deposit  = deposit,
                                          .gas      = gas,
                                          .after    = std::nullopt } );
}

program::result< program::promise_index > execution_context::then( program::promise_index after,
                                                                   const protocol::account_id& account,
                                                                   std::span< const std::byte > input,
                                                                   const protocol::amount_t& deposit,
                                                                   protocol::gas_t gas )
{
  return create_promise( pending_promise{ .receiver = account,
                                          .input    = std::vector( input.begin(), input.end() ),
                                          .deposit  = deposit,
                                          .gas      = gas,
                                          .after    = after } );
}

std::error_code execution_context::promise_return( program::promise_index index )
{
  if( _intent == intent::read_only )
    return controller_errc::read_only_context;

  if( index >= _promises.size() )
    return controller_errc::unknown_promise;

  _returned_promise = index;
  return controller_errc::ok;
}

std::uint64_t execution_context::promise_results_count()
{
  return _receipt.promise_results.size();
}

program::result< protocol::promise_result > execution_context::promise_result( std::uint64_t index )
{
  if( index >= _receipt.promise_results.size() )
    return std::unexpected( controller_errc::unknown_promise );

  return _receipt.promise_results[ index ];
}

} // namespace fungible::controller
