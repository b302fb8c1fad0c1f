#include <fungible/program/error.hpp>
#include <fungible/program/metadata.hpp>

namespace fungible::program {

static constexpr std::string_view default_icon =
  "data:image/svg+xml,%3Csvg%20xmlns%3D%22http%3A%2F%2Fwww.w3.org%2F2000%2Fsvg%22%20viewBox%3D%220%200%2064%2064%22%3E"
  "%3Ccircle%20cx%3D%2232%22%20cy%3D%2232%22%20r%3D%2230%22%20fill%3D%22%2300D8E9%22%2F%3E"
  "%3Ccircle%20cx%3D%2232%22%20cy%3D%2232%22%20r%3D%2218%22%20fill%3D%22%23041858%22%2F%3E%3C%2Fsvg%3E";

static constexpr std::uint8_t default_decimals = 24;

std::error_code validate( const protocol::token_metadata& metadata )
{
  if( metadata.spec != protocol::ft_metadata_spec )
    return program_errc::invalid_metadata;

  if( metadata.reference.has_value() != metadata.reference_hash.has_value() )
    return program_errc::invalid_metadata;

  if( metadata.reference_hash && metadata.reference_hash->size() != protocol::reference_hash_size )
    return program_errc::invalid_metadata;

  return program_errc::ok;
}

protocol::token_metadata default_metadata()
{
  return protocol::token_metadata{ .spec           = std::string( protocol::ft_metadata_spec ),
                                   .name           = "Example NEAR fungible token",
                                   .symbol         = "EXAMPLE",
                                   .icon           = std::string( default_icon ),
                                   .reference      = std::nullopt,
                                   .reference_hash = std::nullopt,
                                   .decimals       = default_decimals };
}

} // namespace fungible::program
