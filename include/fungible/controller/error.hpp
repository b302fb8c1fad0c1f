#pragma once

#include <expected>
#include <system_error>

namespace fungible::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  not_open,
  invalid_account,
  invalid_gas,
  account_not_found,
  program_not_found,
  insufficient_funds,
  balance_overflow,
  gas_exceeded,
  insufficient_gas,
  read_only_context,
  unknown_promise,
  bad_file_descriptor,
  unexpected_end_of_input,
  invalid_event,
  invalid_log,
  program_exception
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::controller

template<>
struct std::is_error_code_enum< fungible::controller::controller_errc >: public std::true_type
{};
