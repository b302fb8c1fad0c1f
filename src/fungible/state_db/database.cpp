#include <fungible/state_db/database.hpp>

#include <stdexcept>

namespace fungible::state_db {

database::database() noexcept = default;

database::~database() {}

void database::open( genesis_init_function init )
{
  if( _root )
    throw std::runtime_error( "database is already open" );

  _root = std::make_shared< state_delta >();

  if( init )
  {
    state_node_ptr root_node = root();
    try
    {
      init( root_node );
    }
    catch( ... )
    {
      _root.reset();
      throw;
    }
  }
}

void database::close()
{
  _root.reset();
}

void database::reset()
{
  if( !_root )
    throw std::runtime_error( "database is not open" );

  _root->clear();
}

bool database::is_open() const
{
  return static_cast< bool >( _root );
}

permanent_state_node_ptr database::root() const
{
  if( _root )
    return std::make_shared< permanent_state_node >( _root );

  return permanent_state_node_ptr();
}

} // namespace fungible::state_db
