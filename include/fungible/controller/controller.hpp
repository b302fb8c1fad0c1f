#pragma once

#include <fungible/controller/error.hpp>
#include <fungible/controller/state.hpp>
#include <fungible/program.hpp>
#include <fungible/protocol.hpp>
#include <fungible/state_db.hpp>

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace fungible::controller {

struct applied_receipt;

/**
 * The hosting runtime. It owns the account state and the deployed programs
 * and drives every transaction to completion, running the receipts created
 * along the way in FIFO order.
 */
class controller
{
public:
  controller( const state::runtime_config& config = {} );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open( const state::genesis_data& data );
  void close();

  /**
   * Installs a program on an account, creating the account when needed.
   */
  std::error_code deploy( const protocol::account_id& account, std::shared_ptr< program::program > program );

  /**
   * Runs a transaction and every receipt it causes. Fails without touching
   * state when the transaction itself cannot be accepted.
   */
  result< protocol::transaction_receipt > process( const protocol::transaction& transaction );

  /**
   * Runs a read only call against current state. Nothing is written.
   */
  result< std::vector< std::byte > > read_program( const protocol::account_id& account,
                                                   std::span< const std::byte > input ) const;

  std::optional< protocol::amount_t > account_balance( const protocol::account_id& account ) const;

  const state::runtime_config& config() const noexcept;

private:
  applied_receipt apply( const protocol::receipt& receipt );
  void refund( const protocol::account_id& account, const protocol::amount_t& amount );

  state_db::database _db;
  state::runtime_config _config;
  std::map< protocol::account_id, std::shared_ptr< program::program >, std::less<> > _programs;
  protocol::receipt_id _next_receipt_id = 0;
};

} // namespace fungible::controller
