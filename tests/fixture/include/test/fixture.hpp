#pragma once

#include <tessera/contract.hpp>
#include <tessera/heartbeat.hpp>
#include <tessera/vm.hpp>

#include <test/manual_clock.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static constexpr std::uint64_t default_gas = 1'000'000;

  static tessera::contract::address make_address( char id );
  static std::string amount( std::uint64_t value );

  tessera::contract::call_input make_call( const tessera::contract::address& caller,
                                           const std::string& function,
                                           std::vector< std::string > arguments        = {},
                                           const tessera::contract::big_integer& value = 0,
                                           std::uint64_t gas                           = default_gas ) const;

  tessera::vm::vm_output call( const tessera::contract::address& caller,
                               const std::string& function,
                               std::vector< std::string > arguments        = {},
                               const tessera::contract::big_integer& value = 0,
                               std::uint64_t gas                           = default_gas );

  tessera::vm::vm_output issue( const tessera::contract::address& caller,
                                const std::string& token_name,
                                std::uint64_t supply,
                                std::vector< std::string > properties = {} );

  tessera::contract::token_data token( std::string_view token_name ) const;
  std::string issued_tokens() const;

  std::unique_ptr< tessera::heartbeat::registry > make_registry( std::set< tessera::heartbeat::public_key > validators = {} );

  std::string _name;
  tessera::contract::big_integer _base_issuing_cost = 1'000;
  tessera::contract::gas_cost _gas_cost;
  tessera::contract::address _owner;
  tessera::contract::address _esdt_address;
  tessera::heartbeat::time_point _genesis;
  tessera::heartbeat::duration _max_unresponsive_threshold = std::chrono::seconds( 10 );

  std::shared_ptr< manual_clock > _clock;
  std::shared_ptr< tessera::vm::system_context > _context;
  std::shared_ptr< tessera::contract::epoch_notifier > _notifier;
  std::shared_ptr< tessera::contract::esdt > _esdt;
  std::unique_ptr< tessera::vm::system_vm > _vm;
};

} // namespace test
