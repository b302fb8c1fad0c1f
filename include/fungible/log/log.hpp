#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <fungible/log/formatter.hpp>
#include <fungible/log/frontend.hpp>

namespace fungible::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the level of the root logger from its name ("tracel1" through
 * "critical"). Throws std::invalid_argument for an unknown name.
 */
void set_level( std::string_view level );

} // namespace fungible::log
