#include <tessera/contract/error.hpp>

#include <string>
#include <utility>

namespace tessera::contract {

struct _contract_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "contract";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< contract_errc >( condition ) )
    {
      case contract_errc::ok:
        return "ok"s;
      case contract_errc::missing_system_interface:
        return "missing system environment interface"s;
      case contract_errc::missing_epoch_notifier:
        return "missing epoch notifier"s;
      case contract_errc::invalid_base_issuing_cost:
        return "invalid base issuing cost"s;
      case contract_errc::invalid_token_name_bounds:
        return "invalid min and max token name lengths"s;
      case contract_errc::zero_initial_supply:
        return "negative or zero initial supply"s;
      case contract_errc::already_registered:
        return "token is already registered"s;
      case contract_errc::reserved_token_name:
        return "token name is reserved"s;
      case contract_errc::not_human_readable:
        return "token name is not human readable"s;
      case contract_errc::invalid_argument:
        return "invalid argument"s;
      case contract_errc::invalid_number_of_arguments:
        return "invalid number of arguments"s;
      case contract_errc::no_such_token:
        return "no token with given name"s;
      case contract_errc::malformed_record:
        return "malformed record"s;
    }
    std::unreachable();
  }
};

const std::error_category& contract_category() noexcept
{
  static _contract_category category;
  return category;
}

std::error_code make_error_code( contract_errc e )
{
  return std::error_code( static_cast< int >( e ), contract_category() );
}

std::string_view to_string( return_code code ) noexcept
{
  using namespace std::string_view_literals;
  switch( code )
  {
    case return_code::ok:
      return "ok"sv;
    case return_code::function_not_found:
      return "function not found"sv;
    case return_code::function_wrong_signature:
      return "function wrong signature"sv;
    case return_code::contract_not_found:
      return "contract not found"sv;
    case return_code::user_error:
      return "user error"sv;
    case return_code::out_of_gas:
      return "out of gas"sv;
    case return_code::out_of_funds:
      return "out of funds"sv;
  }
  std::unreachable();
}

} // namespace tessera::contract
