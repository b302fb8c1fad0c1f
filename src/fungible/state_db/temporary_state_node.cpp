#include <fungible/state_db/state_delta.hpp>
#include <fungible/state_db/state_node.hpp>

namespace fungible::state_db {

temporary_state_node::temporary_state_node( const std::shared_ptr< state_delta >& delta ) noexcept:
    _delta( delta )
{}

std::shared_ptr< state_delta > temporary_state_node::mutable_delta()
{
  if( !_delta )
    throw std::runtime_error( "state node is no longer valid" );

  return _delta;
}

const std::shared_ptr< state_delta >& temporary_state_node::delta() const
{
  if( !_delta )
    throw std::runtime_error( "state node is no longer valid" );

  return _delta;
}

void temporary_state_node::squash()
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  _delta->squash();
  _delta.reset();
}

void temporary_state_node::discard()
{
  if( !_delta )
    throw std::runtime_error( "state node has already been squashed" );

  _delta->clear();
  _delta.reset();
}

} // namespace fungible::state_db
