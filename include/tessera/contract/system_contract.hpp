#pragma once

#include <tessera/contract/error.hpp>
#include <tessera/contract/types.hpp>

namespace tessera::contract {

struct system_contract
{
  system_contract()                         = default;
  system_contract( const system_contract& ) = delete;
  system_contract( system_contract&& )      = delete;
  virtual ~system_contract()                = default;

  system_contract& operator=( const system_contract& ) = delete;
  system_contract& operator=( system_contract&& )      = delete;

  virtual return_code execute( const call_input& input ) = 0;
  virtual void set_new_gas_cost( const gas_cost& cost )  = 0;
};

} // namespace tessera::contract
