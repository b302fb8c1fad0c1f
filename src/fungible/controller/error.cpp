#include <fungible/controller/error.hpp>

#include <string>
#include <utility>

namespace fungible::controller {

struct _controller_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "controller";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< controller_errc >( condition ) )
    {
      case controller_errc::ok:
        return "ok"s;
      case controller_errc::not_open:
        return "controller is not open"s;
      case controller_errc::invalid_account:
        return "invalid account id"s;
      case controller_errc::invalid_gas:
        return "invalid prepaid gas"s;
      case controller_errc::account_not_found:
        return "account not found"s;
      case controller_errc::program_not_found:
        return "no program deployed to account"s;
      case controller_errc::insufficient_funds:
        return "insufficient funds"s;
      case controller_errc::balance_overflow:
        return "native balance overflow"s;
      case controller_errc::gas_exceeded:
        return "exceeded the prepaid gas"s;
      case controller_errc::insufficient_gas:
        return "insufficient gas for the promise"s;
      case controller_errc::read_only_context:
        return "read only context"s;
      case controller_errc::unknown_promise:
        return "unknown promise"s;
      case controller_errc::bad_file_descriptor:
        return "bad file descriptor"s;
      case controller_errc::unexpected_end_of_input:
        return "unexpected end of input"s;
      case controller_errc::invalid_event:
        return "invalid event"s;
      case controller_errc::invalid_log:
        return "invalid log message"s;
      case controller_errc::program_exception:
        return "program raised an exception"s;
    }
    std::unreachable();
  }
};

const std::error_category& controller_category() noexcept
{
  static _controller_category category;
  return category;
}

std::error_code make_error_code( controller_errc e )
{
  return std::error_code( static_cast< int >( e ), controller_category() );
}

} // namespace fungible::controller
