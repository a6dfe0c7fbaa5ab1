#pragma once

#include <tessera/contract/system_interface.hpp>
#include <tessera/vm/error.hpp>
#include <tessera/vm/gas_meter.hpp>
#include <tessera/vm/types.hpp>

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::vm {

/**
 * In-memory environment shared by the system contracts of one VM.
 *
 * Storage is partitioned per contract address and reads and writes go to the
 * partition of the address set through set_sc_address(). Balances, storage and
 * the per call output buffers are not synchronized, calls are serialized by
 * the owning system_vm.
 */
class system_context final: public contract::system_interface
{
public:
  system_context()                        = default;
  system_context( const system_context& ) = delete;
  system_context( system_context&& )      = delete;
  ~system_context() override              = default;

  system_context& operator=( const system_context& ) = delete;
  system_context& operator=( system_context&& )      = delete;

  std::vector< std::byte > get_storage( std::span< const std::byte > key ) override;
  void set_storage( std::span< const std::byte > key, std::span< const std::byte > value ) override;

  std::error_code use_gas( std::uint64_t gas ) override;

  std::error_code transfer( std::string_view destination,
                            std::string_view sender,
                            const big_integer& value,
                            std::span< const std::byte > input,
                            std::uint64_t gas_limit ) override;

  big_integer get_balance( std::string_view account ) override;

  void finish( std::span< const std::byte > data ) override;
  void send_global_setting_to_all( std::string_view sender, std::span< const std::byte > input ) override;
  void add_return_message( std::string_view message ) override;

  void set_sc_address( std::string_view sc_address );
  const address& sc_address() const noexcept;

  void set_gas_provided( std::uint64_t gas );
  std::uint64_t gas_remaining() const noexcept;

  void set_balance( std::string_view account, const big_integer& value );
  std::error_code move_balance( std::string_view from, std::string_view to, const big_integer& value );

  std::vector< std::byte > get_storage_from_address( std::string_view account, std::span< const std::byte > key ) const;

  void clean_cache();
  vm_output create_vm_output( contract::return_code code ) const;

private:
  using storage_map = std::map< std::vector< std::byte >, std::vector< std::byte > >;

  address _sc_address;
  gas_meter _gas;

  std::map< address, storage_map, std::less<> > _storage;
  std::map< address, big_integer, std::less<> > _balances;

  std::vector< std::string > _return_messages;
  std::vector< std::vector< std::byte > > _return_data;
  std::vector< output_transfer > _transfers;
  std::vector< global_setting > _global_settings;
};

} // namespace tessera::vm
