#pragma once

#include <expected>
#include <system_error>

namespace fungible::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  unexpected_end_of_input,
  invalid_boolean,
  invalid_optional,
  length_exceeded
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace fungible::protocol

template<>
struct std::is_error_code_enum< fungible::protocol::protocol_errc >: public std::true_type
{};
