#pragma once

#include <tessera/vm/error.hpp>

#include <cstdint>

namespace tessera::vm {

class gas_meter final
{
public:
  gas_meter( std::uint64_t gas_provided = 0 );
  gas_meter( const gas_meter& ) = default;
  gas_meter( gas_meter&& )      = default;
  ~gas_meter()                  = default;

  gas_meter& operator=( const gas_meter& ) = default;
  gas_meter& operator=( gas_meter&& )      = default;

  std::error_code use_gas( std::uint64_t gas );
  void reset( std::uint64_t gas_provided ) noexcept;

  std::uint64_t provided() const noexcept;
  std::uint64_t remaining() const noexcept;
  std::uint64_t used() const noexcept;

private:
  std::uint64_t _provided;
  std::uint64_t _remaining;
};

} // namespace tessera::vm
