#include <fungible/controller/gas_meter.hpp>

#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

namespace fungible::controller {

gas_meter::gas_meter( protocol::gas_t prepaid, const state::runtime_config& config ) noexcept:
    _prepaid( prepaid ),
    _host_call_cost( config.host_call_cost ),
    _storage_write_byte_cost( config.storage_write_byte_cost )
{}

std::error_code gas_meter::use_gas( protocol::gas_t gas )
{
  if( gas > remaining() )
  {
    _used = _prepaid - _reserved;
    return controller_errc::gas_exceeded;
  }

  _used += gas;

  return controller_errc::ok;
}

std::error_code gas_meter::use_host_call()
{
  return use_gas( _host_call_cost );
}

std::error_code gas_meter::use_storage_write( std::int64_t bytes )
{
  if( bytes <= 0 )
    return use_host_call();

  boost::multiprecision::uint128_t cost =
    boost::multiprecision::uint128_t( bytes ) * _storage_write_byte_cost + _host_call_cost;

  if( cost > std::numeric_limits< protocol::gas_t >::max() )
    return use_gas( std::numeric_limits< protocol::gas_t >::max() );

  return use_gas( cost.convert_to< protocol::gas_t >() );
}

std::error_code gas_meter::reserve( protocol::gas_t gas )
{
  if( gas > remaining() )
    return controller_errc::insufficient_gas;

  _reserved += gas;

  return controller_errc::ok;
}

protocol::gas_t gas_meter::prepaid() const noexcept
{
  return _prepaid;
}

protocol::gas_t gas_meter::used() const noexcept
{
  return _used + _reserved;
}

protocol::gas_t gas_meter::burnt() const noexcept
{
  return _used;
}

protocol::gas_t gas_meter::remaining() const noexcept
{
  return _prepaid - _used - _reserved;
}

} // namespace fungible::controller
