#pragma once

#include <fungible/controller/chronicler.hpp>
#include <fungible/controller/error.hpp>
#include <fungible/controller/gas_meter.hpp>
#include <fungible/controller/state.hpp>
#include <fungible/program.hpp>
#include <fungible/state_db.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fungible::controller {

using program_registry_map = std::map< protocol::account_id, std::shared_ptr< program::program >, std::less<> >;

enum class intent : std::uint8_t
{
  read_only,
  receipt_application
};

/**
 * A call scheduled by a running program. `after` refers to another promise
 * of the same receipt.
 */
struct pending_promise
{
  protocol::account_id receiver;
  std::vector< std::byte > input;
  protocol::amount_t deposit = 0;
  protocol::gas_t gas        = 0;
  std::optional< program::promise_index > after;
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const state_db::state_node_ptr& node,
                     const protocol::receipt& receipt,
                     const state::runtime_config& config,
                     intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  std::error_code run( program::program& program );

  class gas_meter& gas_meter() noexcept;
  class chronicler& chronicler() noexcept;

  std::vector< std::byte >& output() noexcept;
  std::vector< pending_promise >& promises() noexcept;
  const std::optional< program::promise_index >& returned_promise() const noexcept;

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;
  program::result< std::int64_t >
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;
  program::result< std::int64_t > remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  const protocol::account_id& current_account() final;
  const protocol::account_id& get_caller() final;
  const protocol::account_id& get_signer() final;

  protocol::amount_t attached_deposit() final;
  protocol::amount_t storage_byte_cost() final;

  protocol::gas_t prepaid_gas() final;
  protocol::gas_t used_gas() final;
  std::error_code use_gas( protocol::gas_t gas ) final;

  std::error_code emit_event( protocol::event event ) final;
  std::error_code log( std::string_view message ) final;
  void warn( std::error_code warning ) final;

  std::error_code transfer( const protocol::account_id& to, const protocol::amount_t& amount ) final;

  program::result< program::promise_index > call_program( const protocol::account_id& account,
                                                          std::span< const std::byte > input,
                                                          const protocol::amount_t& deposit,
                                                          protocol::gas_t gas ) final;

  program::result< program::promise_index > then( program::promise_index after,
                                                  const protocol::account_id& account,
                                                  std::span< const std::byte > input,
                                                  const protocol::amount_t& deposit,
                                                  protocol::gas_t gas ) final;

  std::error_code promise_return( program::promise_index index ) final;

  std::uint64_t promise_results_count() final;
  program::result< protocol::promise_result > promise_result( std::uint64_t index ) final;

private:
  state_db::object_space create_object_space( std::uint32_t id ) const;
  program::result< program::promise_index > create_promise( pending_promise&& promise );

  state_db::state_node_ptr _state_node;
  const protocol::receipt& _receipt;
  const state::runtime_config& _config;
  intent _intent;

  class gas_meter _gas_meter;
  class chronicler _chronicler;

  std::vector< std::string > _arguments;
  std::size_t _input_offset = 0;
  std::vector< std::byte > _output;

  std::vector< pending_promise > _promises;
  std::optional< program::promise_index > _returned_promise;
};

} // namespace fungible::controller
