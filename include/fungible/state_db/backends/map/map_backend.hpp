#pragma once

#include <fungible/state_db/backends/backend.hpp>

#include <map>

namespace fungible::state_db::backends::map {

class map_backend final: public abstract_backend
{
public:
  map_backend() = default;
  map_backend( std::uint64_t revision );
  ~map_backend() override;

  std::int64_t put( key_type&& key, value_type&& value ) override;
  std::optional< std::span< const std::byte > > get( const key_type& key ) const override;
  std::int64_t remove( const key_type& key ) override;
  void clear() noexcept override;

  std::optional< std::pair< key_type, value_type > > pop_front() override;

  std::uint64_t size() const noexcept override;

  std::shared_ptr< abstract_backend > clone() const override;

private:
  std::map< key_type, value_type > _map;
};

} // namespace fungible::state_db::backends::map
