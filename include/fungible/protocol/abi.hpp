#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fungible/protocol/codec.hpp>
#include <fungible/protocol/types.hpp>

namespace fungible::protocol {

/**
 * Instructions understood by the token program. The instruction is the first
 * u32 of the call input, followed by the instruction arguments.
 */
enum class ft_instruction : std::uint32_t
{
  initialize = 0,
  initialize_default_metadata,
  ft_transfer,
  ft_transfer_call,
  ft_resolve_transfer,
  ft_total_supply,
  ft_balance_of,
  ft_metadata,
  storage_deposit,
  storage_withdraw,
  storage_unregister,
  storage_balance_bounds,
  storage_balance_of
};

/**
 * Instructions a program must understand to receive tokens through
 * ft_transfer_call.
 */
enum class ft_receiver_instruction : std::uint32_t
{
  ft_on_transfer = 100
};

constexpr std::string_view ft_metadata_spec    = "ft-1.0.0";
constexpr std::size_t reference_hash_size      = 32;
constexpr std::string_view nep141_standard     = "nep141";
constexpr std::string_view nep141_version      = "1.0.0";

struct token_metadata
{
  std::string spec;
  std::string name;
  std::string symbol;
  std::optional< std::string > icon;
  std::optional< std::string > reference;
  std::optional< std::vector< std::byte > > reference_hash;
  std::uint8_t decimals = 0;

  bool operator==( const token_metadata& ) const = default;
};

struct storage_balance
{
  amount_t total     = 0;
  amount_t available = 0;

  bool operator==( const storage_balance& ) const = default;
};

struct storage_balance_bounds
{
  amount_t min = 0;
  std::optional< amount_t > max;

  bool operator==( const storage_balance_bounds& ) const = default;
};

void serialize( encoder& e, const token_metadata& m );
std::error_code deserialize( decoder& d, token_metadata& m );

void serialize( encoder& e, const storage_balance& b );
std::error_code deserialize( decoder& d, storage_balance& b );

void serialize( encoder& e, const storage_balance_bounds& b );
std::error_code deserialize( decoder& d, storage_balance_bounds& b );

} // namespace fungible::protocol
