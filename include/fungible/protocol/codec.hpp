#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian.hpp>

#include <fungible/memory.hpp>
#include <fungible/protocol/error.hpp>
#include <fungible/protocol/types.hpp>

namespace fungible::protocol {

constexpr std::uint32_t max_field_length = 1 << 20;

/**
 * Serializes call inputs and return values.
 *
 * Integers are little endian, amounts are 16 byte little endian, strings and
 * byte vectors carry a u32 length prefix, optionals a presence byte.
 */
class encoder final
{
public:
  encoder() = default;

  template< std::integral T >
    requires( !std::same_as< T, bool > )
  encoder& write( T t )
  {
    boost::endian::native_to_little_inplace( t );
    append( memory::as_bytes( t ) );
    return *this;
  }

  template< typename T >
    requires std::is_enum_v< T >
  encoder& write( T t )
  {
    return write( std::to_underlying( t ) );
  }

  encoder& write( bool b );
  encoder& write( const amount_t& amount );
  encoder& write( std::string_view s );
  encoder& write( std::span< const std::byte > bytes );

  template< typename T >
  encoder& write( const std::optional< T >& o )
  {
    write( o.has_value() );
    if( o )
      write( *o );
    return *this;
  }

  template< typename T >
    requires requires( encoder& e, const T& t ) { serialize( e, t ); }
  encoder& write( const T& t )
  {
    serialize( *this, t );
    return *this;
  }

  template< typename... Args >
  encoder& write_all( const Args&... args )
  {
    ( write( args ), ... );
    return *this;
  }

  const std::vector< std::byte >& data() const noexcept;
  std::vector< std::byte > release() noexcept;

private:
  void append( std::span< const std::byte > bytes );

  std::vector< std::byte > _buffer;
};

class decoder final
{
public:
  using source_type = std::function< std::error_code( std::span< std::byte > ) >;

  explicit decoder( std::span< const std::byte > bytes );
  explicit decoder( source_type source );

  template< std::integral T >
    requires( !std::same_as< T, bool > )
  std::error_code read( T& t )
  {
    if( auto error = _source( memory::as_writable_bytes( t ) ); error )
      return error;

    boost::endian::little_to_native_inplace( t );
    return {};
  }

  std::error_code read( bool& b );
  std::error_code read( amount_t& amount );
  std::error_code read( std::string& s );
  std::error_code read( std::vector< std::byte >& bytes );

  template< typename T >
  std::error_code read( std::optional< T >& o )
  {
    bool present = false;
    if( auto error = read_tag( present ); error )
      return error;

    if( !present )
    {
      o.reset();
      return {};
    }

    T t{};
    if( auto error = read( t ); error )
      return error;

    o = std::move( t );
    return {};
  }

  template< typename T >
    requires requires( decoder& d, T& t ) {
      { deserialize( d, t ) } -> std::same_as< std::error_code >;
    }
  std::error_code read( T& t )
  {
    return deserialize( *this, t );
  }

  template< typename... Args >
  std::error_code read_all( Args&... args )
  {
    std::error_code error;
    ( ( error = error ? error : read( args ) ), ... );
    return error;
  }

private:
  std::error_code read_tag( bool& present );
  std::error_code read_length( std::uint32_t& length );

  source_type _source;
};

template< typename... Args >
std::vector< std::byte > encode_all( const Args&... args )
{
  encoder e;
  e.write_all( args... );
  return e.release();
}

} // namespace fungible::protocol
