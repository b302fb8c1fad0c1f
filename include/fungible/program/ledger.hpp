#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <fungible/program/error.hpp>
#include <fungible/program/system_interface.hpp>
#include <fungible/protocol.hpp>

namespace fungible::program {

namespace space {

constexpr std::uint32_t metadata = 0;
constexpr std::uint32_t accounts = 1;

} // namespace space

namespace key {

constexpr std::string_view total_supply          = "total_supply";
constexpr std::string_view metadata              = "metadata";
constexpr std::string_view account_storage_usage = "account_storage_usage";

} // namespace key

/**
 * The token state of one contract account: balances of registered
 * accounts, the fixed total supply, metadata and the measured storage
 * footprint of a ledger entry.
 *
 * An account is registered if and only if it has a ledger entry. A zero
 * balance is a present entry.
 */
class ledger final
{
public:
  explicit ledger( system_interface* system ) noexcept;
  ledger( const ledger& ) = delete;
  ledger( ledger&& )      = delete;
  ~ledger()               = default;

  ledger& operator=( const ledger& ) = delete;
  ledger& operator=( ledger&& )      = delete;

  bool initialized();

  result< protocol::amount_t > total_supply();
  std::error_code set_total_supply( const protocol::amount_t& supply );

  result< protocol::token_metadata > metadata();
  std::error_code set_metadata( const protocol::token_metadata& metadata );

  result< std::uint64_t > account_storage_usage();
  std::error_code set_account_storage_usage( std::uint64_t usage );

  /**
   * Returns the balance of an account, or nothing if it is not registered.
   */
  result< std::optional< protocol::amount_t > > balance_of( std::string_view account );
  result< protocol::amount_t > unwrap_balance_of( std::string_view account );
  result< bool > registered( std::string_view account );

  /**
   * Creates a zero balance entry. Returns the storage used by the entry.
   */
  result< std::int64_t > register_account( std::string_view account );
  std::error_code unregister_account( std::string_view account );

  std::error_code internal_withdraw( std::string_view account, const protocol::amount_t& amount );
  std::error_code internal_deposit( std::string_view account, const protocol::amount_t& amount );

  /**
   * Moves tokens between two registered accounts and emits an ft_transfer
   * event. Nothing is written unless every check passes.
   */
  std::error_code internal_transfer( std::string_view sender,
                                     std::string_view receiver,
                                     const protocol::amount_t& amount,
                                     const std::optional< std::string >& memo );

private:
  std::error_code put_balance( std::string_view account, const protocol::amount_t& balance );
  result< protocol::amount_t > checked_deposit( const protocol::amount_t& balance, const protocol::amount_t& amount );

  system_interface* _system;
};

} // namespace fungible::program
