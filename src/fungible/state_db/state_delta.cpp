#include <fungible/state_db/backends/map/map_backend.hpp>
#include <fungible/state_db/state_delta.hpp>

namespace fungible::state_db {

state_delta::state_delta() noexcept:
    _backend( std::make_shared< backends::map::map_backend >() )
{}

std::int64_t state_delta::remove( std::vector< std::byte >&& key )
{
  std::int64_t size = 0;

  if( auto current_value = get( key ); current_value )
    size -= std::ssize( key ) + std::ssize( *current_value );
  else
    return size;

  _backend->remove( key );

  if( !root() )
    _removed_objects.emplace( std::move( key ) );

  return size;
}

std::optional< std::span< const std::byte > > state_delta::get( const std::vector< std::byte >& key ) const
{
  for( const state_delta* node = this; node != nullptr; node = node->_parent.get() )
  {
    if( node->removed( key ) )
      return {};

    if( auto value = node->_backend->get( key ); value )
      return value;
  }

  return {};
}

void state_delta::squash()
{
  if( root() )
    throw std::runtime_error( "cannot squash a state delta with no parent" );

  // An object removed here is only removed in the parent. An object written
  // here and removed in the parent is only written in the parent.
  for( auto itr = _removed_objects.begin(); itr != _removed_objects.end(); itr = _removed_objects.begin() )
  {
    _parent->_backend->remove( *itr );

    if( !_parent->root() )
      _parent->_removed_objects.insert( _removed_objects.extract( itr ) );
    else
      _removed_objects.erase( itr );
  }

  while( auto key_value_pair = _backend->pop_front() )
  {
    if( !_parent->root() )
      _parent->_removed_objects.erase( key_value_pair->first );

    _parent->_backend->put( std::move( key_value_pair->first ), std::move( key_value_pair->second ) );
  }
}

void state_delta::clear()
{
  _backend->clear();
  _removed_objects.clear();
}

bool state_delta::removed( const std::vector< std::byte >& key ) const
{
  return _removed_objects.contains( key );
}

bool state_delta::root() const
{
  return !_parent;
}

std::uint64_t state_delta::revision() const
{
  return _backend->revision();
}

const std::shared_ptr< state_delta >& state_delta::parent() const
{
  return _parent;
}

std::shared_ptr< state_delta > state_delta::make_child()
{
  auto child      = std::make_shared< state_delta >();
  child->_parent  = shared_from_this();
  child->_backend = std::make_shared< backends::map::map_backend >( revision() + 1 );
  return child;
}

} // namespace fungible::state_db
