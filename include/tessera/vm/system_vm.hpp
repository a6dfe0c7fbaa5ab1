#pragma once

#include <tessera/contract/system_contract.hpp>
#include <tessera/contract/types.hpp>
#include <tessera/vm/error.hpp>
#include <tessera/vm/system_context.hpp>
#include <tessera/vm/types.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>

namespace tessera::vm {

using contract_map = std::map< address, std::shared_ptr< contract::system_contract >, std::less<> >;

/**
 * Executes calls against the system contracts deployed at fixed addresses.
 *
 * Each call resets the shared context, scopes storage to the recipient and
 * moves the call value to the contract once it returns ok.
 */
class system_vm final
{
  struct create_key
  {
    explicit create_key() = default;
  };

public:
  system_vm( create_key, std::shared_ptr< system_context > context, contract_map contracts );
  system_vm( const system_vm& ) = delete;
  system_vm( system_vm&& )      = delete;
  ~system_vm()                  = default;

  system_vm& operator=( const system_vm& ) = delete;
  system_vm& operator=( system_vm&& )      = delete;

  static result< std::unique_ptr< system_vm > > create( std::shared_ptr< system_context > context,
                                                        contract_map contracts = {} );

  std::error_code deploy( std::string_view sc_address, std::shared_ptr< contract::system_contract > contract );

  vm_output run_smart_contract_create( const contract::call_input& input );
  vm_output run_smart_contract_call( const contract::call_input& input );

  void set_new_gas_cost( const contract::gas_cost& cost );

  std::shared_ptr< contract::system_contract > get_contract( std::string_view sc_address ) const;
  std::shared_ptr< system_context > context() const noexcept;

private:
  vm_output run( const contract::call_input& input );

  const std::shared_ptr< system_context > _context;

  std::mutex _execution_mutex;

  mutable std::shared_mutex _contracts_mutex;
  contract_map _contracts;
};

} // namespace tessera::vm
