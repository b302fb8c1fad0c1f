#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace fungible::protocol {

bool valid_utf8( std::string_view str ) noexcept;

/**
 * Checks every string and object key inside a JSON value for valid UTF-8.
 */
bool valid_utf8( const nlohmann::ordered_json& value ) noexcept;

} // namespace fungible::protocol
