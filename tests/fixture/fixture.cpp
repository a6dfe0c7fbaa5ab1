// NOLINTBEGIN

#include <test/fixture.hpp>

#include <stdexcept>

#include <tessera/encode.hpp>
#include <tessera/log.hpp>
#include <tessera/memory.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level ):
    _name( name ),
    _owner( make_address( 'o' ) ),
    _esdt_address( make_address( '\x01' ) ),
    _genesis( std::chrono::seconds( 1'600'000'000 ) ),
    _clock( std::make_shared< manual_clock >( _genesis ) ),
    _context( std::make_shared< tessera::vm::system_context >() ),
    _notifier( std::make_shared< tessera::contract::epoch_notifier >() )
{
  tessera::log::initialize( quill::loglevel_from_string( log_level ) );
  LOG_INFO( tessera::log::instance(), "Starting fixture: {}", _name );

  _esdt_address[ 30 ] = '\xff';

  _gas_cost.esdt_issue         = 100;
  _gas_cost.esdt_operations    = 10;
  _gas_cost.data_copy_per_byte = 1;

  tessera::contract::esdt_args args;
  args.system                     = _context;
  args.gas                        = _gas_cost;
  args.settings.owner_address     = _owner;
  args.settings.base_issuing_cost = _base_issuing_cost.str();
  args.esdt_address               = _esdt_address;
  args.notifier                   = _notifier;

  auto sc = tessera::contract::esdt::create( args );
  if( !sc )
    throw std::runtime_error( "unable to create ESDT contract: " + sc.error().message() );

  _esdt = *sc;

  auto vm = tessera::vm::system_vm::create( _context );
  if( !vm )
    throw std::runtime_error( "unable to create system VM: " + vm.error().message() );

  _vm = std::move( *vm );

  if( auto error = _vm->deploy( _esdt_address, _esdt ); error )
    throw std::runtime_error( "unable to deploy ESDT contract: " + error.message() );

  auto output = _vm->run_smart_contract_create( make_call( _owner, "" ) );
  if( output.code != tessera::contract::return_code::ok )
    throw std::runtime_error( "unable to initialize ESDT contract: " + output.return_message );
}

fixture::~fixture()
{
  LOG_INFO( tessera::log::instance(), "Finished fixture: {}", _name );
}

tessera::contract::address fixture::make_address( char id )
{
  tessera::contract::address a( 32, '\0' );
  a.back() = id;
  return a;
}

std::string fixture::amount( std::uint64_t value )
{
  auto bytes = tessera::encode::from_big_integer( value );
  if( !bytes )
    throw std::runtime_error( bytes.error().message() );

  return std::string( tessera::memory::as_string_view( *bytes ) );
}

tessera::contract::call_input fixture::make_call( const tessera::contract::address& caller,
                                                  const std::string& function,
                                                  std::vector< std::string > arguments,
                                                  const tessera::contract::big_integer& value,
                                                  std::uint64_t gas ) const
{
  tessera::contract::call_input input;
  input.function     = function;
  input.caller       = caller;
  input.recipient    = _esdt_address;
  input.call_value   = value;
  input.gas_provided = gas;
  input.arguments    = std::move( arguments );
  return input;
}

tessera::vm::vm_output fixture::call( const tessera::contract::address& caller,
                                      const std::string& function,
                                      std::vector< std::string > arguments,
                                      const tessera::contract::big_integer& value,
                                      std::uint64_t gas )
{
  return _vm->run_smart_contract_call( make_call( caller, function, std::move( arguments ), value, gas ) );
}

tessera::vm::vm_output fixture::issue( const tessera::contract::address& caller,
                                       const std::string& token_name,
                                       std::uint64_t supply,
                                       std::vector< std::string > properties )
{
  std::vector< std::string > arguments{ token_name, amount( supply ) };
  arguments.insert( arguments.end(), properties.begin(), properties.end() );
  return call( caller, "issue", std::move( arguments ), _base_issuing_cost );
}

tessera::contract::token_data fixture::token( std::string_view token_name ) const
{
  auto t = tessera::contract::unmarshal_token(
    _context->get_storage_from_address( _esdt_address, tessera::memory::as_bytes( token_name ) ) );
  if( !t )
    throw std::runtime_error( "unable to read token " + std::string( token_name ) + ": " + t.error().message() );

  return *t;
}

std::string fixture::issued_tokens() const
{
  auto list = _context->get_storage_from_address(
    _esdt_address,
    tessera::memory::as_bytes( tessera::contract::esdt::issued_tokens_key ) );
  return std::string( tessera::memory::as_string_view( list ) );
}

std::unique_ptr< tessera::heartbeat::registry >
fixture::make_registry( std::set< tessera::heartbeat::public_key > validators )
{
  auto r = tessera::heartbeat::registry::create( _max_unresponsive_threshold, _genesis, _clock, std::move( validators ) );
  if( !r )
    throw std::runtime_error( "unable to create registry: " + r.error().message() );

  return std::move( *r );
}

} // namespace test

// NOLINTEND
