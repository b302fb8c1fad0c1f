#pragma once

#include <fungible/state_db/state_node.hpp>

namespace fungible::state_db {

/**
 * database holds the committed state of the runtime in its root node.
 *
 * Work happens against temporary children of the root. A child is squashed
 * into its parent when the work succeeds and discarded when it fails, so
 * partial writes never reach the root.
 *
 * database is not thread safe. Writes on a node and its children need to
 * be serialized.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, running init against the empty root node.
   */
  void open( genesis_init_function init );

  /**
   * Close the database.
   */
  void close();

  /**
   * Reset the database to an empty state.
   */
  void reset();

  bool is_open() const;

  /**
   * Get and return the current "root" node.
   *
   * Returns an empty pointer if the database is not open.
   */
  permanent_state_node_ptr root() const;

private:
  std::shared_ptr< state_delta > _root;
};

} // namespace fungible::state_db
