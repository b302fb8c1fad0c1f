#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <fungible/program/system_interface.hpp>
#include <fungible/protocol.hpp>

namespace fungible::program::events {

std::error_code ft_mint( system_interface* system,
                         std::string_view owner,
                         const protocol::amount_t& amount,
                         const std::optional< std::string >& memo );

std::error_code ft_transfer( system_interface* system,
                             std::string_view old_owner,
                             std::string_view new_owner,
                             const protocol::amount_t& amount,
                             const std::optional< std::string >& memo );

} // namespace fungible::program::events
