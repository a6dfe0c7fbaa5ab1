#pragma once

#include <tessera/contract/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

namespace tessera::contract {

/**
 * Capabilities a system contract consumes from its environment.
 *
 * Storage is scoped to the address of the contract being executed. A missing
 * key reads as an empty value. Single get and set operations are atomic, there
 * are no multi-key transactions.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::vector< std::byte > get_storage( std::span< const std::byte > key )            = 0;
  virtual void set_storage( std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code use_gas( std::uint64_t gas ) = 0;

  virtual std::error_code transfer( std::string_view destination,
                                    std::string_view sender,
                                    const big_integer& value,
                                    std::span< const std::byte > input,
                                    std::uint64_t gas_limit ) = 0;

  virtual big_integer get_balance( std::string_view account ) = 0;

  virtual void finish( std::span< const std::byte > data )                                               = 0;
  virtual void send_global_setting_to_all( std::string_view sender, std::span< const std::byte > input ) = 0;
  virtual void add_return_message( std::string_view message )                                            = 0;
};

} // namespace tessera::contract
