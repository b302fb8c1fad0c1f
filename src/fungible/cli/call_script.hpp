#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <fungible/protocol.hpp>

namespace fungible::cli {

/**
 * One line of a call script:
 *
 *   {"signer":"owner.near","method":"ft_transfer","args":{"receiver_id":"bob.near","amount":"500"},"deposit":"1"}
 *
 * `receiver` defaults to the token account, `deposit` to 0 and `gas` to the
 * maximum prepaid gas. A call with "view": true runs read only.
 */
struct call
{
  protocol::account_id signer;
  protocol::account_id receiver;
  std::string method;
  nlohmann::json args = nlohmann::json::object();
  protocol::amount_t deposit = 0;
  protocol::gas_t gas        = 0;
  bool view                  = false;
};

/**
 * Amounts travel as base-10 strings. Throws std::invalid_argument.
 */
protocol::amount_t parse_amount( const nlohmann::json& value );

protocol::token_metadata metadata_from_json( const nlohmann::json& value );
nlohmann::ordered_json metadata_to_json( const protocol::token_metadata& metadata );

/**
 * Parses a script line. Throws std::invalid_argument for malformed lines.
 */
call parse_call( std::string_view line,
                 const protocol::account_id& default_receiver,
                 protocol::gas_t default_gas );

/**
 * Builds the program input for a named method. Throws std::invalid_argument
 * for unknown methods or missing arguments.
 */
std::vector< std::byte > encode_call( const std::string& method, const nlohmann::json& args );

/**
 * Renders the return value of a method as JSON. Methods without a return
 * value render as null.
 */
nlohmann::ordered_json decode_result( const std::string& method, std::span< const std::byte > output );

nlohmann::ordered_json to_json( const std::string& method, const protocol::transaction_receipt& receipt );

} // namespace fungible::cli
