#pragma once

#include <span>
#include <string>

#include <fungible/program/error.hpp>
#include <fungible/program/ledger.hpp>
#include <fungible/program/program.hpp>

namespace fungible::program {

constexpr protocol::gas_t gas_for_resolve_transfer = 5 * protocol::tera_gas;
constexpr protocol::gas_t gas_for_ft_transfer_call = 25 * protocol::tera_gas + gas_for_resolve_transfer;

/**
 * A fungible token following NEP-141 with NEP-145 storage management.
 */
struct fungible_token final: public program
{
  fungible_token()                        = default;
  fungible_token( const fungible_token& ) = delete;
  fungible_token( fungible_token&& )      = delete;
  ~fungible_token() override              = default;

  fungible_token& operator=( const fungible_token& ) = delete;
  fungible_token& operator=( fungible_token&& )      = delete;

  std::error_code run( system_interface* system, std::span< const std::string > arguments ) override;

private:
  std::error_code initialize( system_interface* system, ledger& state, protocol::decoder& input, bool default_meta );

  std::error_code ft_transfer( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code ft_transfer_call( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code ft_resolve_transfer( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code ft_total_supply( system_interface* system, ledger& state );
  std::error_code ft_balance_of( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code ft_metadata( system_interface* system, ledger& state );

  std::error_code storage_deposit( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code storage_withdraw( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code storage_unregister( system_interface* system, ledger& state, protocol::decoder& input );
  std::error_code storage_balance_bounds( system_interface* system, ledger& state );
  std::error_code storage_balance_of( system_interface* system, ledger& state, protocol::decoder& input );

  result< protocol::amount_t > storage_bond( system_interface* system, ledger& state );
};

} // namespace fungible::program
