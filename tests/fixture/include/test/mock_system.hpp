#pragma once

#include <fungible/program.hpp>
#include <fungible/protocol.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace test {

/**
 * An in-memory system_interface for driving a program without a controller.
 * Effects are recorded for inspection instead of being applied.
 */
class mock_system final: public fungible::program::system_interface
{
public:
  struct promise
  {
    fungible::protocol::account_id receiver;
    std::vector< std::byte > input;
    fungible::protocol::amount_t deposit = 0;
    fungible::protocol::gas_t gas        = 0;
    std::optional< fungible::program::promise_index > after;
  };

  mock_system( fungible::protocol::account_id current );
  ~mock_system() final = default;

  /**
   * Prepares the next call: clears input, output and recorded effects.
   */
  void prepare( fungible::protocol::account_id caller,
                std::vector< std::byte >&& input,
                const fungible::protocol::amount_t& deposit = 0,
                fungible::protocol::gas_t gas               = 300 * fungible::protocol::tera_gas );

  std::span< const std::string > arguments() final;
  std::error_code write( fungible::program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( fungible::program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;
  fungible::program::result< std::int64_t >
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;
  fungible::program::result< std::int64_t > remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  const fungible::protocol::account_id& current_account() final;
  const fungible::protocol::account_id& get_caller() final;
  const fungible::protocol::account_id& get_signer() final;

  fungible::protocol::amount_t attached_deposit() final;
  fungible::protocol::amount_t storage_byte_cost() final;

  fungible::protocol::gas_t prepaid_gas() final;
  fungible::protocol::gas_t used_gas() final;
  std::error_code use_gas( fungible::protocol::gas_t gas ) final;

  std::error_code emit_event( fungible::protocol::event event ) final;
  std::error_code log( std::string_view message ) final;
  void warn( std::error_code warning ) final;

  std::error_code transfer( const fungible::protocol::account_id& to, const fungible::protocol::amount_t& amount ) final;

  fungible::program::result< fungible::program::promise_index > call_program( const fungible::protocol::account_id& account,
                                                                              std::span< const std::byte > input,
                                                                              const fungible::protocol::amount_t& deposit,
                                                                              fungible::protocol::gas_t gas ) final;

  fungible::program::result< fungible::program::promise_index > then( fungible::program::promise_index after,
                                                                      const fungible::protocol::account_id& account,
                                                                      std::span< const std::byte > input,
                                                                      const fungible::protocol::amount_t& deposit,
                                                                      fungible::protocol::gas_t gas ) final;

  std::error_code promise_return( fungible::program::promise_index index ) final;

  std::uint64_t promise_results_count() final;
  fungible::program::result< fungible::protocol::promise_result > promise_result( std::uint64_t index ) final;

  fungible::protocol::account_id current;
  fungible::protocol::account_id caller;
  fungible::protocol::amount_t deposit           = 0;
  fungible::protocol::amount_t byte_cost         = 10'000'000'000'000'000'000ull;
  fungible::protocol::gas_t prepaid              = 0;
  fungible::protocol::gas_t used                 = 0;

  std::vector< std::byte > input;
  std::size_t input_offset = 0;
  std::vector< std::byte > output;

  std::map< std::pair< std::uint32_t, std::vector< std::byte > >, std::vector< std::byte > > objects;

  std::vector< fungible::protocol::event > events;
  std::vector< std::string > logs;
  std::vector< std::error_code > warnings;
  std::vector< std::pair< fungible::protocol::account_id, fungible::protocol::amount_t > > transfers;
  std::vector< promise > promises;
  std::optional< fungible::program::promise_index > returned;
  std::vector< fungible::protocol::promise_result > promise_results;
};

} // namespace test
