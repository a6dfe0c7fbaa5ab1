#pragma once

#include <chrono>

namespace tessera::heartbeat {

using time_point = std::chrono::system_clock::time_point;
using duration   = std::chrono::system_clock::duration;

struct clock
{
  clock()               = default;
  clock( const clock& ) = delete;
  clock( clock&& )      = delete;
  virtual ~clock()      = default;

  clock& operator=( const clock& ) = delete;
  clock& operator=( clock&& )      = delete;

  virtual time_point now() const = 0;
};

struct system_clock final: public clock
{
  time_point now() const override;
};

} // namespace tessera::heartbeat
