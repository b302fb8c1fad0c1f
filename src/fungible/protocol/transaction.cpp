#include <fungible/protocol/account.hpp>
#include <fungible/protocol/transaction.hpp>

#include <algorithm>

namespace fungible::protocol {

bool transaction::validate() const noexcept
{
  if( !gas )
    return false;

  return valid_account_id( signer ) && valid_account_id( receiver );
}

std::size_t transaction::size() const noexcept
{
  std::size_t bytes = 0;

  bytes += signer.size();
  bytes += receiver.size();
  bytes += input.size();
  bytes += sizeof( deposit );
  bytes += sizeof( gas );

  return bytes;
}

const receipt_outcome* transaction_receipt::find( receipt_id id ) const noexcept
{
  auto itr = std::ranges::find( outcomes, id, &receipt_outcome::id );
  if( itr == outcomes.end() )
    return nullptr;

  return &*itr;
}

std::vector< std::string > transaction_receipt::log_lines() const
{
  std::vector< std::string > lines;

  for( const auto& outcome: outcomes )
  {
    for( const auto& line: outcome.logs )
      lines.push_back( line );
  }

  return lines;
}

} // namespace fungible::protocol
