#pragma once

#include <fungible/controller/error.hpp>
#include <fungible/controller/state.hpp>

#include <cstdint>

namespace fungible::controller {

/**
 * Tracks the gas of a single receipt. Gas attached to promises is reserved
 * and counts as used by the receipt that created them.
 */
class gas_meter final
{
public:
  gas_meter( protocol::gas_t prepaid, const state::runtime_config& config ) noexcept;
  gas_meter( const gas_meter& ) = default;
  gas_meter( gas_meter&& )      = default;
  ~gas_meter()                  = default;

  gas_meter& operator=( const gas_meter& ) = default;
  gas_meter& operator=( gas_meter&& )      = default;

  std::error_code use_gas( protocol::gas_t gas );
  std::error_code use_host_call();
  std::error_code use_storage_write( std::int64_t bytes );
  std::error_code reserve( protocol::gas_t gas );

  protocol::gas_t prepaid() const noexcept;
  protocol::gas_t used() const noexcept;
  protocol::gas_t burnt() const noexcept;
  protocol::gas_t remaining() const noexcept;

private:
  protocol::gas_t _prepaid;
  protocol::gas_t _used     = 0;
  protocol::gas_t _reserved = 0;
  protocol::gas_t _host_call_cost;
  protocol::gas_t _storage_write_byte_cost;
};

} // namespace fungible::controller
