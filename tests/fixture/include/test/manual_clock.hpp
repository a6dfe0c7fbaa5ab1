#pragma once

#include <mutex>

#include <tessera/heartbeat/clock.hpp>

namespace test {

class manual_clock final: public tessera::heartbeat::clock
{
public:
  explicit manual_clock( tessera::heartbeat::time_point start ):
      _now( start )
  {}

  tessera::heartbeat::time_point now() const override
  {
    std::lock_guard lock( _mutex );
    return _now;
  }

  void set( tessera::heartbeat::time_point t )
  {
    std::lock_guard lock( _mutex );
    _now = t;
  }

  void advance( tessera::heartbeat::duration d )
  {
    std::lock_guard lock( _mutex );
    _now += d;
  }

private:
  mutable std::mutex _mutex;
  tessera::heartbeat::time_point _now;
};

} // namespace test
