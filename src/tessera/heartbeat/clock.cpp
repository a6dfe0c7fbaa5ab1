#include <tessera/heartbeat/clock.hpp>

namespace tessera::heartbeat {

time_point system_clock::now() const
{
  return std::chrono::system_clock::now();
}

} // namespace tessera::heartbeat
