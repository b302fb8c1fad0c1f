#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace fungible::state_db::backends {

using key_type   = std::vector< std::byte >;
using value_type = std::vector< std::byte >;

class abstract_backend
{
public:
  abstract_backend() = default;
  abstract_backend( std::uint64_t revision );
  virtual ~abstract_backend() {};

  virtual std::int64_t put( key_type&& key, value_type&& value )                                 = 0;
  virtual std::optional< std::span< const std::byte > > get( const key_type& key ) const          = 0;
  virtual std::int64_t remove( const key_type& key )                                             = 0;
  virtual void clear()                                                                           = 0;

  /**
   * Removes and returns the first object in key order.
   */
  virtual std::optional< std::pair< key_type, value_type > > pop_front() = 0;

  virtual std::uint64_t size() const = 0;
  bool empty() const;

  std::uint64_t revision() const;
  void set_revision( std::uint64_t );

  virtual std::shared_ptr< abstract_backend > clone() const = 0;

private:
  std::uint64_t _revision = 0;
};

} // namespace fungible::state_db::backends
