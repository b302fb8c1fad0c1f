#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fungible/protocol/event.hpp>
#include <fungible/protocol/types.hpp>

namespace fungible::protocol {

using receipt_id = std::uint64_t;

enum class promise_status : std::uint8_t
{
  successful,
  failed
};

struct promise_result
{
  promise_status status = promise_status::failed;
  std::vector< std::byte > data;

  bool successful() const noexcept
  {
    return status == promise_status::successful;
  }
};

/**
 * A signed request to call a program. Processing a transaction creates the
 * first receipt.
 */
struct transaction
{
  account_id signer;
  account_id receiver;
  std::vector< std::byte > input;
  amount_t deposit = 0;
  gas_t gas        = 0;

  bool validate() const noexcept;
  std::size_t size() const noexcept;
};

/**
 * A single call scheduled by the runtime. Receipts created by a program run
 * after the creating receipt finishes.
 */
struct receipt
{
  receipt_id id = 0;
  account_id predecessor;
  account_id signer;
  account_id receiver;
  std::vector< std::byte > input;
  amount_t deposit = 0;
  gas_t gas        = 0;
  std::vector< promise_result > promise_results;
};

struct receipt_outcome
{
  receipt_id id = 0;
  account_id predecessor;
  account_id receiver;
  std::error_code error;
  std::vector< std::byte > output;
  std::optional< receipt_id > forwarded_to;
  std::vector< event > events;
  std::vector< std::string > logs;
  std::vector< std::error_code > warnings;
  gas_t gas_burnt = 0;

  bool successful() const noexcept
  {
    return !error;
  }
};

struct transaction_receipt
{
  std::vector< receipt_outcome > outcomes;
  std::error_code error;
  std::vector< std::byte > output;

  bool successful() const noexcept
  {
    return !error;
  }

  const receipt_outcome* find( receipt_id id ) const noexcept;

  /**
   * Returns every log line in execution order, event lines included.
   */
  std::vector< std::string > log_lines() const;
};

} // namespace fungible::protocol
