#pragma once

#include <cstddef>
#include <string_view>

namespace fungible::protocol {

constexpr std::size_t min_account_id_length = 2;
constexpr std::size_t max_account_id_length = 64;

/**
 * Checks an account id against the platform naming rule: 2 to 64
 * characters of lowercase letters and digits, separated by single
 * '-', '_' or '.' characters.
 */
bool valid_account_id( std::string_view id ) noexcept;

} // namespace fungible::protocol
