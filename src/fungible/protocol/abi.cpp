#include <fungible/protocol/abi.hpp>

namespace fungible::protocol {

void serialize( encoder& e, const token_metadata& m )
{
  e.write_all( m.spec, m.name, m.symbol, m.icon, m.reference, m.reference_hash, m.decimals );
}

std::error_code deserialize( decoder& d, token_metadata& m )
{
  return d.read_all( m.spec, m.name, m.symbol, m.icon, m.reference, m.reference_hash, m.decimals );
}

void serialize( encoder& e, const storage_balance& b )
{
  e.write_all( b.total, b.available );
}

std::error_code deserialize( decoder& d, storage_balance& b )
{
  return d.read_all( b.total, b.available );
}

void serialize( encoder& e, const storage_balance_bounds& b )
{
  e.write_all( b.min, b.max );
}

std::error_code deserialize( decoder& d, storage_balance_bounds& b )
{
  return d.read_all( b.min, b.max );
}

} // namespace fungible::protocol
