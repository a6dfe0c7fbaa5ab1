#include <tessera/memory.hpp>
#include <tessera/vm/system_context.hpp>

namespace tessera::vm {

std::vector< std::byte > system_context::get_storage( std::span< const std::byte > key )
{
  return get_storage_from_address( _sc_address, key );
}

void system_context::set_storage( std::span< const std::byte > key, std::span< const std::byte > value )
{
  auto& storage = _storage[ _sc_address ];

  if( value.empty() )
  {
    storage.erase( memory::to_vector( key ) );
    return;
  }

  storage.insert_or_assign( memory::to_vector( key ), memory::to_vector( value ) );
}

std::vector< std::byte > system_context::get_storage_from_address( std::string_view account,
                                                                   std::span< const std::byte > key ) const
{
  auto storage = _storage.find( account );
  if( storage == _storage.end() )
    return {};

  auto itr = storage->second.find( memory::to_vector( key ) );
  if( itr == storage->second.end() )
    return {};

  return itr->second;
}

std::error_code system_context::use_gas( std::uint64_t gas )
{
  return _gas.use_gas( gas );
}

std::error_code system_context::transfer( std::string_view destination,
                                          std::string_view sender,
                                          const big_integer& value,
                                          std::span< const std::byte > input,
                                          std::uint64_t gas_limit )
{
  if( auto error = move_balance( sender, destination, value ); error )
    return error;

  _transfers.emplace_back( output_transfer{ .sender      = address( sender ),
                                            .destination = address( destination ),
                                            .value       = value,
                                            .data        = memory::to_vector( input ),
                                            .gas_limit   = gas_limit } );

  return vm_errc::ok;
}

big_integer system_context::get_balance( std::string_view account )
{
  auto itr = _balances.find( account );
  if( itr == _balances.end() )
    return 0;

  return itr->second;
}

void system_context::set_balance( std::string_view account, const big_integer& value )
{
  _balances.insert_or_assign( address( account ), value );
}

std::error_code system_context::move_balance( std::string_view from, std::string_view to, const big_integer& value )
{
  if( value < 0 )
    return vm_errc::negative_value;

  if( value == 0 )
    return vm_errc::ok;

  auto from_balance = get_balance( from );
  if( from_balance < value )
    return vm_errc::insufficient_funds;

  auto to_balance = get_balance( to );

  from_balance -= value;
  to_balance   += value;

  set_balance( from, from_balance );
  set_balance( to, to_balance );

  return vm_errc::ok;
}

void system_context::finish( std::span< const std::byte > data )
{
  _return_data.emplace_back( memory::to_vector( data ) );
}

void system_context::send_global_setting_to_all( std::string_view sender, std::span< const std::byte > input )
{
  _global_settings.emplace_back( global_setting{ .sender = address( sender ), .data = memory::to_vector( input ) } );
}

void system_context::add_return_message( std::string_view message )
{
  _return_messages.emplace_back( message );
}

void system_context::set_sc_address( std::string_view sc_address )
{
  _sc_address = sc_address;
}

const address& system_context::sc_address() const noexcept
{
  return _sc_address;
}

void system_context::set_gas_provided( std::uint64_t gas )
{
  _gas.reset( gas );
}

std::uint64_t system_context::gas_remaining() const noexcept
{
  return _gas.remaining();
}

void system_context::clean_cache()
{
  _return_messages.clear();
  _return_data.clear();
  _transfers.clear();
  _global_settings.clear();
  _gas.reset( 0 );
}

vm_output system_context::create_vm_output( contract::return_code code ) const
{
  vm_output output;
  output.code            = code;
  output.return_data     = _return_data;
  output.gas_remaining   = _gas.remaining();
  output.transfers       = _transfers;
  output.global_settings = _global_settings;

  for( const auto& message: _return_messages )
  {
    if( !output.return_message.empty() )
      output.return_message += '@';

    output.return_message += message;
  }

  return output;
}

} // namespace tessera::vm
