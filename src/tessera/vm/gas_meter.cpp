#include <tessera/vm/gas_meter.hpp>

namespace tessera::vm {

gas_meter::gas_meter( std::uint64_t gas_provided ):
    _provided( gas_provided ),
    _remaining( gas_provided )
{}

std::error_code gas_meter::use_gas( std::uint64_t gas )
{
  if( gas > _remaining )
    return vm_errc::insufficient_gas;

  _remaining -= gas;

  return vm_errc::ok;
}

void gas_meter::reset( std::uint64_t gas_provided ) noexcept
{
  _provided  = gas_provided;
  _remaining = gas_provided;
}

std::uint64_t gas_meter::provided() const noexcept
{
  return _provided;
}

std::uint64_t gas_meter::remaining() const noexcept
{
  return _remaining;
}

std::uint64_t gas_meter::used() const noexcept
{
  return _provided - _remaining;
}

} // namespace tessera::vm
