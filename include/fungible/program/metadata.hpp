#pragma once

#include <system_error>

#include <fungible/protocol/abi.hpp>

namespace fungible::program {

/**
 * Checks the spec tag and that reference and reference_hash come as a pair
 * with a 32 byte hash.
 */
std::error_code validate( const protocol::token_metadata& metadata );

protocol::token_metadata default_metadata();

} // namespace fungible::program
