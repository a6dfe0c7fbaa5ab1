#include <tessera/heartbeat/error.hpp>

#include <string>
#include <utility>

namespace tessera::heartbeat {

struct _heartbeat_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "heartbeat";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< heartbeat_errc >( condition ) )
    {
      case heartbeat_errc::ok:
        return "ok"s;
      case heartbeat_errc::invalid_threshold:
        return "invalid max duration peer unresponsive"s;
      case heartbeat_errc::missing_clock:
        return "missing clock"s;
    }
    std::unreachable();
  }
};

const std::error_category& heartbeat_category() noexcept
{
  static _heartbeat_category category;
  return category;
}

std::error_code make_error_code( heartbeat_errc e )
{
  return std::error_code( static_cast< int >( e ), heartbeat_category() );
}

} // namespace tessera::heartbeat
