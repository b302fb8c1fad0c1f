#include <fungible/protocol/codec.hpp>

#include <algorithm>
#include <limits>

namespace fungible::protocol {

constexpr std::uint64_t low_mask  = std::numeric_limits< std::uint64_t >::max();
constexpr unsigned int half_width = 64;

void encoder::append( std::span< const std::byte > bytes )
{
  _buffer.insert( _buffer.end(), bytes.begin(), bytes.end() );
}

encoder& encoder::write( bool b )
{
  return write( static_cast< std::uint8_t >( b ? 1 : 0 ) );
}

encoder& encoder::write( const amount_t& amount )
{
  write( static_cast< std::uint64_t >( amount & low_mask ) );
  write( static_cast< std::uint64_t >( amount >> half_width ) );
  return *this;
}

encoder& encoder::write( std::string_view s )
{
  return write( memory::as_bytes( s ) );
}

encoder& encoder::write( std::span< const std::byte > bytes )
{
  write( static_cast< std::uint32_t >( bytes.size() ) );
  append( bytes );
  return *this;
}

const std::vector< std::byte >& encoder::data() const noexcept
{
  return _buffer;
}

std::vector< std::byte > encoder::release() noexcept
{
  return std::move( _buffer );
}

decoder::decoder( std::span< const std::byte > bytes ):
    _source(
      [ bytes, offset = std::size_t( 0 ) ]( std::span< std::byte > buffer ) mutable -> std::error_code
      {
        if( bytes.size() - offset < buffer.size() )
          return protocol_errc::unexpected_end_of_input;

        std::ranges::copy( bytes.subspan( offset, buffer.size() ), buffer.begin() );
        offset += buffer.size();
        return {};
      } )
{}

decoder::decoder( source_type source ):
    _source( std::move( source ) )
{}

std::error_code decoder::read_tag( bool& present )
{
  std::uint8_t tag = 0;
  if( auto error = read( tag ); error )
    return error;

  if( tag > 1 )
    return protocol_errc::invalid_optional;

  present = tag == 1;
  return {};
}

std::error_code decoder::read_length( std::uint32_t& length )
{
  if( auto error = read( length ); error )
    return error;

  if( length > max_field_length )
    return protocol_errc::length_exceeded;

  return {};
}

std::error_code decoder::read( bool& b )
{
  std::uint8_t value = 0;
  if( auto error = read( value ); error )
    return error;

  if( value > 1 )
    return protocol_errc::invalid_boolean;

  b = value == 1;
  return {};
}

std::error_code decoder::read( amount_t& amount )
{
  std::uint64_t low  = 0;
  std::uint64_t high = 0;

  if( auto error = read_all( low, high ); error )
    return error;

  amount = ( amount_t( high ) << half_width ) | amount_t( low );
  return {};
}

std::error_code decoder::read( std::string& s )
{
  std::uint32_t length = 0;
  if( auto error = read_length( length ); error )
    return error;

  s.assign( length, '\0' );
  return _source( std::as_writable_bytes( std::span( s ) ) );
}

std::error_code decoder::read( std::vector< std::byte >& bytes )
{
  std::uint32_t length = 0;
  if( auto error = read_length( length ); error )
    return error;

  bytes.assign( length, std::byte{ 0x00 } );
  return _source( std::span( bytes ) );
}

} // namespace fungible::protocol
