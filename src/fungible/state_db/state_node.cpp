#include <fungible/state_db/state_delta.hpp>
#include <fungible/state_db/state_node.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

#include <boost/endian.hpp>

namespace fungible::state_db {

std::vector< std::byte > make_compound_key( const object_space& space, std::span< const std::byte > key )
{
  std::vector< std::byte > compound_key;
  compound_key.reserve( 1 + sizeof( std::uint32_t ) * 2 + space.owner.size() + key.size() );

  compound_key.push_back( space.system ? std::byte{ 0x01 } : std::byte{ 0x00 } );

  // The owner precedes the space id so an account's objects are contiguous
  auto owner_length = boost::endian::native_to_big( static_cast< std::uint32_t >( space.owner.size() ) );
  std::ranges::copy( memory::as_bytes( owner_length ), std::back_inserter( compound_key ) );
  std::ranges::copy( memory::as_bytes( std::string_view( space.owner ) ), std::back_inserter( compound_key ) );

  auto id = boost::endian::native_to_big( space.id );
  std::ranges::copy( memory::as_bytes( id ), std::back_inserter( compound_key ) );

  std::ranges::copy( key, std::back_inserter( compound_key ) );
  return compound_key;
}

std::optional< std::span< const std::byte > > state_node::get( const object_space& space,
                                                               std::span< const std::byte > key ) const
{
  return delta()->get( make_compound_key( space, key ) );
}

std::int64_t state_node::remove( const object_space& space, std::span< const std::byte > key )
{
  return mutable_delta()->remove( make_compound_key( space, key ) );
}

std::shared_ptr< temporary_state_node > state_node::make_child()
{
  return std::make_shared< temporary_state_node >( mutable_delta()->make_child() );
}

std::uint64_t state_node::revision() const
{
  return delta()->revision();
}

permanent_state_node::permanent_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::shared_ptr< state_delta > permanent_state_node::mutable_delta()
{
  return _delta;
}

const std::shared_ptr< state_delta >& permanent_state_node::delta() const
{
  return _delta;
}

} // namespace fungible::state_db
