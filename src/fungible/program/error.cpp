#include <fungible/program/error.hpp>

#include <string>
#include <utility>

namespace fungible::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _program_category::name() const noexcept
{
  return "program";
}

std::string _program_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< program_errc >( condition ) )
  {
    case program_errc::ok:
      return "ok"s;
    case program_errc::already_initialized:
      return "already initialized"s;
    case program_errc::not_initialized:
      return "not initialized"s;
    case program_errc::not_registered:
      return "account is not registered"s;
    case program_errc::insufficient_balance:
      return "insufficient balance"s;
    case program_errc::overflow:
      return "overflow"s;
    case program_errc::insufficient_deposit:
      return "insufficient deposit"s;
    case program_errc::non_zero_balance:
      return "cannot unregister an account with a positive balance"s;
    case program_errc::self_transfer:
      return "sender and receiver should be different"s;
    case program_errc::zero_amount:
      return "the amount should be a positive number"s;
    case program_errc::receiver_not_registered:
      return "receiver is not registered"s;
    case program_errc::refund_truncated:
      return "refund truncated"s;
    case program_errc::unauthorized:
      return "unauthorized"s;
    case program_errc::requires_one_yocto:
      return "requires attached deposit of exactly 1 yocto"s;
    case program_errc::deposit_not_accepted:
      return "method does not accept a deposit"s;
    case program_errc::insufficient_gas:
      return "more gas is required"s;
    case program_errc::insufficient_storage_balance:
      return "insufficient storage balance"s;
    case program_errc::invalid_metadata:
      return "invalid metadata"s;
    case program_errc::invalid_instruction:
      return "invalid instruction"s;
    case program_errc::invalid_argument:
      return "invalid argument"s;
    case program_errc::unexpected_object:
      return "unexpected object"s;
  }
  std::unreachable();
}

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace fungible::program
