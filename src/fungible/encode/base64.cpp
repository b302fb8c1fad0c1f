#include <fungible/encode/base64.hpp>

#include <algorithm>
#include <cstdint>

namespace fungible::encode {

constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char padding              = '=';
constexpr std::size_t group_size    = 4;
constexpr std::uint32_t sextet_mask = 0x3f;
constexpr std::uint32_t octet_mask  = 0xff;

static result< std::uint32_t > decode_character( char c ) noexcept
{
  if( auto pos = alphabet.find( c ); pos != std::string_view::npos )
    return static_cast< std::uint32_t >( pos );

  return std::unexpected( encode_errc::invalid_character );
}

std::string to_base64( std::span< const std::byte > s ) noexcept
{
  std::string encoded;
  encoded.reserve( ( s.size() + 2 ) / 3 * group_size );

  for( std::size_t i = 0; i < s.size(); i += 3 )
  {
    std::size_t remaining = std::min< std::size_t >( 3, s.size() - i );
    std::uint32_t group   = std::to_integer< std::uint32_t >( s[ i ] ) << 16;

    if( remaining > 1 )
      group |= std::to_integer< std::uint32_t >( s[ i + 1 ] ) << 8;
    if( remaining > 2 )
      group |= std::to_integer< std::uint32_t >( s[ i + 2 ] );

    encoded.push_back( alphabet[ ( group >> 18 ) & sextet_mask ] );
    encoded.push_back( alphabet[ ( group >> 12 ) & sextet_mask ] );
    encoded.push_back( remaining > 1 ? alphabet[ ( group >> 6 ) & sextet_mask ] : padding );
    encoded.push_back( remaining > 2 ? alphabet[ group & sextet_mask ] : padding );
  }

  return encoded;
}

result< std::vector< std::byte > > from_base64( std::string_view sv ) noexcept
{
  if( sv.size() % group_size != 0 )
    return std::unexpected( encode_errc::invalid_length );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / group_size * 3 );

  for( std::size_t i = 0; i < sv.size(); i += group_size )
  {
    bool last = i + group_size == sv.size();

    std::size_t pad = 0;
    if( sv[ i + 3 ] == padding )
      pad = sv[ i + 2 ] == padding ? 2 : 1;

    if( pad && !last )
      return std::unexpected( encode_errc::invalid_padding );

    std::uint32_t group = 0;
    for( std::size_t j = 0; j < group_size - pad; ++j )
    {
      auto value = decode_character( sv[ i + j ] );
      if( !value )
        return std::unexpected( value.error() );

      group |= *value << ( 18 - 6 * j );
    }

    bytes.push_back( static_cast< std::byte >( ( group >> 16 ) & octet_mask ) );
    if( pad < 2 )
      bytes.push_back( static_cast< std::byte >( ( group >> 8 ) & octet_mask ) );
    if( pad < 1 )
      bytes.push_back( static_cast< std::byte >( group & octet_mask ) );
  }

  return bytes;
}

} // namespace fungible::encode
