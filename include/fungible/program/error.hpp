#pragma once

#include <expected>
#include <system_error>

namespace fungible::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  already_initialized,
  not_initialized,
  not_registered,
  insufficient_balance,
  overflow,
  insufficient_deposit,
  non_zero_balance,
  self_transfer,
  zero_amount,
  receiver_not_registered,
  refund_truncated,
  unauthorized,
  requires_one_yocto,
  deposit_not_accepted,
  insufficient_gas,
  insufficient_storage_balance,
  invalid_metadata,
  invalid_instruction,
  invalid_argument,
  unexpected_object
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::program

template<>
struct std::is_error_code_enum< fungible::program::program_errc >: public std::true_type
{};
