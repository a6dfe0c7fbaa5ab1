#include <tessera/log.hpp>
#include <tessera/memory.hpp>
#include <tessera/vm/system_vm.hpp>

namespace tessera::vm {

result< std::unique_ptr< system_vm > > system_vm::create( std::shared_ptr< system_context > context,
                                                          contract_map contracts )
{
  if( !context )
    return std::unexpected( vm_errc::missing_context );

  return std::make_unique< system_vm >( create_key{}, std::move( context ), std::move( contracts ) );
}

system_vm::system_vm( create_key, std::shared_ptr< system_context > context, contract_map contracts ):
    _context( std::move( context ) ),
    _contracts( std::move( contracts ) )
{}

std::error_code system_vm::deploy( std::string_view sc_address, std::shared_ptr< contract::system_contract > contract )
{
  std::unique_lock lock( _contracts_mutex );

  if( _contracts.contains( sc_address ) )
    return vm_errc::already_deployed;

  _contracts.emplace( address( sc_address ), std::move( contract ) );

  LOG_INFO( tessera::log::instance(),
            "Deployed system smart contract - Address: {}",
            log::hex{ memory::as_bytes( sc_address ).data(), sc_address.size() } );

  return vm_errc::ok;
}

vm_output system_vm::run_smart_contract_create( const contract::call_input& input )
{
  auto create_input     = input;
  create_input.function = contract::init_function_name;

  return run( create_input );
}

vm_output system_vm::run_smart_contract_call( const contract::call_input& input )
{
  return run( input );
}

vm_output system_vm::run( const contract::call_input& input )
{
  auto sc = get_contract( input.recipient );

  std::lock_guard lock( _execution_mutex );

  _context->clean_cache();
  _context->set_sc_address( input.recipient );
  _context->set_gas_provided( input.gas_provided );

  if( !sc )
  {
    _context->add_return_message( make_error_code( vm_errc::unknown_contract ).message() );
    return _context->create_vm_output( contract::return_code::contract_not_found );
  }

  if( input.call_value > 0 && _context->get_balance( input.caller ) < input.call_value )
  {
    _context->add_return_message( make_error_code( vm_errc::insufficient_funds ).message() );
    return _context->create_vm_output( contract::return_code::out_of_funds );
  }

  auto code = sc->execute( input );

  if( code == contract::return_code::ok && input.call_value > 0 )
  {
    if( auto error = _context->move_balance( input.caller, input.recipient, input.call_value ); error )
    {
      _context->add_return_message( error.message() );
      code = contract::return_code::out_of_funds;
    }
  }

  LOG_DEBUG( tessera::log::instance(),
             "System smart contract call - Function: {}, Return code: {}, Gas remaining: {}",
             input.function,
             contract::to_string( code ),
             _context->gas_remaining() );

  return _context->create_vm_output( code );
}

void system_vm::set_new_gas_cost( const contract::gas_cost& cost )
{
  std::shared_lock lock( _contracts_mutex );

  for( const auto& [ sc_address, sc ]: _contracts )
    sc->set_new_gas_cost( cost );

  LOG_INFO( tessera::log::instance(),
            "Updated gas schedule - Issue: {}, Operations: {}, Data copy per byte: {}",
            cost.esdt_issue,
            cost.esdt_operations,
            cost.data_copy_per_byte );
}

std::shared_ptr< contract::system_contract > system_vm::get_contract( std::string_view sc_address ) const
{
  std::shared_lock lock( _contracts_mutex );

  auto itr = _contracts.find( sc_address );
  if( itr == _contracts.end() )
    return {};

  return itr->second;
}

std::shared_ptr< system_context > system_vm::context() const noexcept
{
  return _context;
}

} // namespace tessera::vm
