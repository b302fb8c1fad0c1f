#pragma once

#include <fungible/program/error.hpp>
#include <fungible/protocol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace fungible::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout,
  stderr
};

/**
 * Index of a promise created by the running receipt.
 */
using promise_index = std::uint64_t;

struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments()                                       = 0;
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  /**
   * Objects live in spaces owned by the running account. An empty span
   * means the object does not exist.
   */
  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  /**
   * Writes return the change in stored bytes.
   */
  virtual result< std::int64_t >
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;
  virtual result< std::int64_t > remove_object( std::uint32_t id, std::span< const std::byte > key )   = 0;

  virtual const protocol::account_id& current_account() = 0;
  virtual const protocol::account_id& get_caller()      = 0;
  virtual const protocol::account_id& get_signer()      = 0;

  virtual protocol::amount_t attached_deposit()  = 0;
  virtual protocol::amount_t storage_byte_cost() = 0;

  virtual protocol::gas_t prepaid_gas()               = 0;
  virtual protocol::gas_t used_gas()                  = 0;
  virtual std::error_code use_gas( protocol::gas_t gas ) = 0;

  virtual std::error_code emit_event( protocol::event event ) = 0;
  virtual std::error_code log( std::string_view message )     = 0;
  virtual void warn( std::error_code warning )                = 0;

  /**
   * Moves native currency from the running account.
   */
  virtual std::error_code transfer( const protocol::account_id& to, const protocol::amount_t& amount ) = 0;

  /**
   * Schedules a call that runs after the current receipt finishes. Gas for
   * the call is reserved from the current receipt.
   */
  virtual result< promise_index > call_program( const protocol::account_id& account,
                                                std::span< const std::byte > input,
                                                const protocol::amount_t& deposit,
                                                protocol::gas_t gas ) = 0;

  /**
   * Schedules a call that runs after promise `after` finishes and receives
   * its outcome as promise result 0.
   */
  virtual result< promise_index > then( promise_index after,
                                        const protocol::account_id& account,
                                        std::span< const std::byte > input,
                                        const protocol::amount_t& deposit,
                                        protocol::gas_t gas ) = 0;

  /**
   * Makes the outcome of a promise the return value of the current receipt.
   */
  virtual std::error_code promise_return( promise_index index ) = 0;

  virtual std::uint64_t promise_results_count()                                  = 0;
  virtual result< protocol::promise_result > promise_result( std::uint64_t index ) = 0;
};

} // namespace fungible::program
