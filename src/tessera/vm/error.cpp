#include <tessera/vm/error.hpp>

#include <string>
#include <utility>

namespace tessera::vm {

struct _vm_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "vm";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< vm_errc >( condition ) )
    {
      case vm_errc::ok:
        return "ok"s;
      case vm_errc::missing_context:
        return "missing system context"s;
      case vm_errc::insufficient_gas:
        return "not enough gas"s;
      case vm_errc::insufficient_funds:
        return "insufficient funds"s;
      case vm_errc::negative_value:
        return "negative transfer value"s;
      case vm_errc::unknown_contract:
        return "unknown system smart contract"s;
      case vm_errc::already_deployed:
        return "system smart contract already deployed at address"s;
    }
    std::unreachable();
  }
};

const std::error_category& vm_category() noexcept
{
  static _vm_category category;
  return category;
}

std::error_code make_error_code( vm_errc e )
{
  return std::error_code( static_cast< int >( e ), vm_category() );
}

} // namespace tessera::vm
