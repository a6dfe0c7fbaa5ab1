#include <tessera/contract/esdt.hpp>
#include <tessera/encode.hpp>
#include <tessera/log.hpp>
#include <tessera/memory.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <mutex>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>

namespace tessera::contract {

namespace {

constexpr std::string_view esdt_transfer  = "ESDTTransfer";
constexpr std::string_view esdt_freeze    = "ESDTFreeze";
constexpr std::string_view esdt_unfreeze  = "ESDTUnFreeze";
constexpr std::string_view esdt_wipe      = "ESDTWipe";
constexpr std::string_view esdt_pause     = "ESDTPause";
constexpr std::string_view esdt_unpause   = "ESDTUnPause";
constexpr std::string_view list_separator = "@";

std::string hex_of( std::string_view s )
{
  return encode::to_hex( memory::as_bytes( s ), false );
}

big_integer to_amount( const std::string& argument )
{
  return encode::to_big_integer( memory::as_bytes( argument ) );
}

std::string directive( std::string_view builtin_function, std::string_view token_name )
{
  std::string data( builtin_function );
  data += list_separator;
  data += hex_of( token_name );
  return data;
}

result< std::string > transfer_directive( std::string_view token_name, const big_integer& amount )
{
  auto amount_bytes = encode::from_big_integer( amount );
  if( !amount_bytes )
    return std::unexpected( amount_bytes.error() );

  auto data = directive( esdt_transfer, token_name );
  data     += list_separator;
  data     += encode::to_hex( *amount_bytes, false );
  return data;
}

result< bool > parse_setting( std::string_view value )
{
  if( value == "true" )
    return true;

  if( value == "false" )
    return false;

  return std::unexpected( contract_errc::invalid_argument );
}

std::error_code apply_properties( token_data& token, std::span< const std::string > arguments )
{
  if( arguments.empty() )
    return contract_errc::ok;

  if( arguments.size() % 2 != 0 )
    return contract_errc::invalid_number_of_arguments;

  for( std::size_t i = 0; i < arguments.size(); i += 2 )
  {
    const auto& property = arguments[ i ];

    auto value = parse_setting( arguments[ i + 1 ] );
    if( !value )
      return value.error();

    if( property == "canBurn" )
      token.burnable = *value;
    else if( property == "canMint" )
      token.mintable = *value;
    else if( property == "canPause" )
      token.can_pause = *value;
    else if( property == "canFreeze" )
      token.can_freeze = *value;
    else if( property == "canWipe" )
      token.can_wipe = *value;
    else if( property == "canUpgrade" )
      token.upgradable = *value;
    else if( property == "canChangeOwner" )
      token.can_change_owner = *value;
    else
      return contract_errc::invalid_argument;
  }

  return contract_errc::ok;
}

std::string labeled( std::string_view label, bool value )
{
  std::string s( label );
  s += '-';
  s += value ? "true" : "false";
  return s;
}

} // namespace

bool is_human_readable( std::string_view token_name ) noexcept
{
  return std::ranges::all_of( token_name,
                              []( char c )
                              {
                                return ( c >= 'a' && c <= 'z' ) || ( c >= 'A' && c <= 'Z' ) || ( c >= '0' && c <= '9' );
                              } );
}

result< std::shared_ptr< esdt > > esdt::create( const esdt_args& args )
{
  if( !args.system )
    return std::unexpected( contract_errc::missing_system_interface );

  if( !args.notifier )
    return std::unexpected( contract_errc::missing_epoch_notifier );

  auto base_issuing_cost = encode::parse_decimal( args.settings.base_issuing_cost );
  if( !base_issuing_cost || *base_issuing_cost < 0 )
    return std::unexpected( contract_errc::invalid_base_issuing_cost );

  if( args.settings.min_token_name_length > args.settings.max_token_name_length )
    return std::unexpected( contract_errc::invalid_token_name_bounds );

  auto contract = std::make_shared< esdt >( create_key{}, args, *base_issuing_cost );
  args.notifier->register_handler( contract );

  return contract;
}

esdt::esdt( create_key, const esdt_args& args, const big_integer& base_issuing_cost ):
    _system( args.system ),
    _gas_cost( args.gas ),
    _base_issuing_cost( base_issuing_cost ),
    _owner_address( args.settings.owner_address ),
    _esdt_address( args.esdt_address ),
    _min_token_name_length( args.settings.min_token_name_length ),
    _max_token_name_length( args.settings.max_token_name_length ),
    _enabled_epoch( args.settings.enabled_epoch )
{}

std::optional< esdt::function > esdt::lookup( std::string_view name ) noexcept
{
  static constexpr std::array< std::pair< std::string_view, function >, 16 > functions{
    {
     { init_function_name, function::init },
     { "issue", function::issue },
     { "issueProtected", function::issue_protected },
     { "ESDTBurn", function::burn },
     { "mint", function::mint },
     { "freeze", function::freeze },
     { "unFreeze", function::unfreeze },
     { "wipe", function::wipe },
     { "pause", function::pause },
     { "unPause", function::unpause },
     { "claim", function::claim },
     { "configChange", function::config_change },
     { "esdtControlChanges", function::control_changes },
     { "transferOwnership", function::transfer_ownership },
     { "getAllESDTTokens", function::get_all_tokens },
     { "getTokenProperties", function::get_token_properties },
     }
  };

  auto itr = std::ranges::find( functions, name, &std::pair< std::string_view, function >::first );
  if( itr == functions.end() )
    return {};

  return itr->second;
}

return_code esdt::execute( const call_input& input )
{
  std::shared_lock lock( _mutex );

  if( input.call_value < 0 )
    return fail( return_code::user_error, "negative call value" );

  auto fn = lookup( input.function );

  if( fn == function::init )
    return init( input );

  if( !enabled() )
    return fail( return_code::user_error, "ESDT SC disabled" );

  if( !fn )
    return fail( return_code::function_not_found, "invalid method to call" );

  switch( *fn )
  {
    case function::init:
      std::unreachable();
    case function::issue:
      return issue( input );
    case function::issue_protected:
      return issue_protected( input );
    case function::burn:
      return burn( input );
    case function::mint:
      return mint( input );
    case function::freeze:
      return toggle_freeze( input, esdt_freeze );
    case function::unfreeze:
      return toggle_freeze( input, esdt_unfreeze );
    case function::wipe:
      return wipe( input );
    case function::pause:
      return toggle_pause( input, esdt_pause );
    case function::unpause:
      return toggle_pause( input, esdt_unpause );
    case function::claim:
      return claim( input );
    case function::config_change:
      return config_change( input );
    case function::control_changes:
      return control_changes( input );
    case function::transfer_ownership:
      return transfer_ownership( input );
    case function::get_all_tokens:
      return get_all_tokens( input );
    case function::get_token_properties:
      return get_token_properties( input );
  }

  std::unreachable();
}

void esdt::set_new_gas_cost( const gas_cost& cost )
{
  std::unique_lock lock( _mutex );
  _gas_cost = cost;
}

void esdt::epoch_confirmed( std::uint32_t epoch )
{
  bool enable = epoch >= _enabled_epoch;

  if( _enabled.exchange( enable ) != enable )
    LOG_INFO( tessera::log::instance(), "ESDT contract {} - Epoch: {}", enable ? "enabled" : "disabled", epoch );
}

bool esdt::enabled() const noexcept
{
  return _enabled;
}

return_code esdt::init( const call_input& input )
{
  if( !_system->get_storage( memory::as_bytes( config_key ) ).empty() )
    return fail( return_code::user_error, "ESDT SC already initialized" );

  save_config( default_config() );

  LOG_DEBUG( tessera::log::instance(),
             "ESDT contract initialized - Address: {}, Base issuing cost: {}",
             log::hex{ memory::as_bytes( input.recipient ).data(), input.recipient.size() },
             _base_issuing_cost.str() );

  return return_code::ok;
}

return_code esdt::issue( const call_input& input )
{
  if( input.arguments.size() < 2 )
    return fail( return_code::function_wrong_signature, "not enough arguments" );

  if( _system->use_gas( _gas_cost.esdt_issue ) )
    return fail( return_code::out_of_gas, "not enough gas" );

  auto config = get_config();
  if( !config )
    return fail( return_code::user_error, config.error().message() );

  const auto& token_name = input.arguments[ 0 ];
  if( token_name.size() < config->min_token_name_length || token_name.size() > config->max_token_name_length )
    return fail( return_code::function_wrong_signature, "token name length not in parameters" );

  if( input.call_value != config->base_issuing_cost )
    return fail( return_code::out_of_funds, "callValue not equals with baseIssuingCost" );

  if( auto error = issue_token( input.caller, input.arguments ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

return_code esdt::issue_protected( const call_input& input )
{
  if( input.caller != _owner_address )
    return fail( return_code::user_error, "issueProtected can be called by whitelisted address only" );

  if( input.arguments.size() < 3 )
    return fail( return_code::function_wrong_signature, "not enough arguments" );

  if( input.arguments[ 0 ].size() != input.caller.size() )
    return fail( return_code::function_wrong_signature, "invalid owner address length" );

  if( auto error = _system->use_gas( _gas_cost.esdt_issue ); error )
    return fail( return_code::out_of_gas, error.message() );

  auto config = get_config();
  if( !config )
    return fail( return_code::user_error, config.error().message() );

  if( input.call_value != config->base_issuing_cost )
    return fail( return_code::out_of_funds, "callValue not equals with baseIssuingCost" );

  auto arguments = std::span< const std::string >( input.arguments ).subspan( 1 );
  if( auto error = issue_token( input.arguments[ 0 ], arguments ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

std::error_code esdt::issue_token( std::string_view owner, std::span< const std::string > arguments )
{
  const auto& token_name = arguments[ 0 ];
  auto initial_supply    = to_amount( arguments[ 1 ] );

  if( initial_supply <= 0 )
    return contract_errc::zero_initial_supply;

  if( token_name == config_key || token_name == issued_tokens_key )
    return contract_errc::reserved_token_name;

  if( !_system->get_storage( memory::as_bytes( token_name ) ).empty() )
    return contract_errc::already_registered;

  if( !is_human_readable( token_name ) )
    return contract_errc::not_human_readable;

  token_data token;
  token.owner_address = owner;
  token.token_name    = token_name;
  token.minted_value  = initial_supply;
  token.burnt_value   = 0;
  token.upgradable    = true;

  if( auto error = apply_properties( token, arguments.subspan( 2 ) ); error )
    return error;

  save_token( token );

  auto data = transfer_directive( token_name, initial_supply );
  if( !data )
    return data.error();

  if( auto error = _system->transfer( owner, _esdt_address, 0, memory::as_bytes( *data ), 0 ); error )
    return error;

  add_to_issued_tokens( token_name );

  LOG_DEBUG( tessera::log::instance(),
             "Token issued - Name: {}, Supply: {}, Owner: {}",
             token_name,
             initial_supply.str(),
             log::hex{ memory::as_bytes( owner ).data(), owner.size() } );

  return contract_errc::ok;
}

void esdt::add_to_issued_tokens( std::string_view token_name )
{
  auto key  = memory::as_bytes( issued_tokens_key );
  auto list = _system->get_storage( key );

  if( !list.empty() )
  {
    auto separator = memory::as_bytes( list_separator );
    list.insert( list.end(), separator.begin(), separator.end() );
  }

  auto name = memory::as_bytes( token_name );
  list.insert( list.end(), name.begin(), name.end() );

  _system->set_storage( key, list );
}

return_code esdt::burn( const call_input& input )
{
  if( input.arguments.size() != 2 )
    return fail( return_code::function_wrong_signature, "number of arguments must be equal with 2" );

  if( input.call_value != 0 )
    return fail( return_code::out_of_funds, "callValue must be 0" );

  auto amount = to_amount( input.arguments[ 1 ] );
  if( amount <= 0 )
    return fail( return_code::user_error, "negative or 0 value to burn" );

  auto token = get_existing_token( input.arguments[ 0 ] );
  if( !token )
    return fail( return_code::user_error, token.error().message() );

  if( !token->burnable )
    return fail( return_code::user_error, "token is not burnable" );

  token->burnt_value += amount;
  save_token( *token );

  if( auto error = _system->use_gas( input.gas_provided ); error )
    return fail( return_code::out_of_gas, error.message() );

  return return_code::ok;
}

return_code esdt::basic_ownership_checks( const call_input& input, token_data& token )
{
  if( input.call_value != 0 )
    return fail( return_code::out_of_funds, "callValue must be 0" );

  if( _system->use_gas( _gas_cost.esdt_operations ) )
    return fail( return_code::out_of_gas, "not enough gas" );

  auto existing = get_existing_token( input.arguments[ 0 ] );
  if( !existing )
    return fail( return_code::user_error, existing.error().message() );

  if( existing->owner_address != input.caller )
    return fail( return_code::user_error, "can be called by owner only" );

  token = std::move( *existing );
  return return_code::ok;
}

return_code esdt::mint( const call_input& input )
{
  if( input.arguments.size() < 2 || input.arguments.size() > 3 )
    return fail( return_code::function_wrong_signature, "accepted arguments number 2/3" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  auto amount = to_amount( input.arguments[ 1 ] );
  if( amount <= 0 )
    return fail( return_code::user_error, "negative or zero mint value" );

  if( !token.mintable )
    return fail( return_code::user_error, "token is not mintable" );

  token.minted_value += amount;
  save_token( token );

  address destination = token.owner_address;
  if( input.arguments.size() == 3 )
  {
    if( input.arguments[ 2 ].size() != input.caller.size() )
      return fail( return_code::user_error, "destination address of invalid length" );

    destination = input.arguments[ 2 ];
  }

  auto data = transfer_directive( token.token_name, amount );
  if( !data )
    return fail( return_code::user_error, data.error().message() );

  if( auto error = _system->transfer( destination, _esdt_address, 0, memory::as_bytes( *data ), 0 ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

return_code esdt::toggle_freeze( const call_input& input, std::string_view builtin_function )
{
  if( input.arguments.size() != 2 )
    return fail( return_code::function_wrong_signature, "invalid number of arguments, wanted 2" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  if( !token.can_freeze )
    return fail( return_code::user_error, "cannot freeze" );

  auto data = directive( builtin_function, token.token_name );
  if( auto error = _system->transfer( input.arguments[ 1 ], _esdt_address, 0, memory::as_bytes( data ), 0 ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

return_code esdt::wipe( const call_input& input )
{
  if( input.arguments.size() != 2 )
    return fail( return_code::function_wrong_signature, "invalid number of arguments, wanted 2" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  if( !token.can_wipe )
    return fail( return_code::user_error, "cannot wipe" );

  if( input.arguments[ 1 ].size() != input.caller.size() )
    return fail( return_code::user_error, "invalid arguments" );

  auto data = directive( esdt_wipe, token.token_name );
  if( auto error = _system->transfer( input.arguments[ 1 ], _esdt_address, 0, memory::as_bytes( data ), 0 ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

return_code esdt::toggle_pause( const call_input& input, std::string_view builtin_function )
{
  if( input.arguments.size() != 1 )
    return fail( return_code::function_wrong_signature, "invalid number of arguments, wanted 1" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  if( !token.can_pause )
    return fail( return_code::user_error, "cannot pause/un-pause" );

  if( token.is_paused && builtin_function == esdt_pause )
    return fail( return_code::user_error, "cannot pause an already paused contract" );

  if( !token.is_paused && builtin_function == esdt_unpause )
    return fail( return_code::user_error, "cannot unPause an already un-paused contract" );

  token.is_paused = !token.is_paused;
  save_token( token );

  auto data = directive( builtin_function, token.token_name );
  _system->send_global_setting_to_all( _esdt_address, memory::as_bytes( data ) );

  return return_code::ok;
}

return_code esdt::claim( const call_input& input )
{
  if( input.caller != _owner_address )
    return fail( return_code::user_error, "claim can be called by whitelisted address only" );

  if( input.call_value != 0 )
    return fail( return_code::user_error, "callValue must be 0" );

  if( auto error = _system->use_gas( _gas_cost.esdt_operations ); error )
    return fail( return_code::out_of_gas, error.message() );

  if( !input.arguments.empty() )
    return fail( return_code::user_error, make_error_code( contract_errc::invalid_number_of_arguments ).message() );

  auto balance = _system->get_balance( input.recipient );
  if( auto error = _system->transfer( input.caller, input.recipient, balance, {}, 0 ); error )
    return fail( return_code::user_error, error.message() );

  return return_code::ok;
}

return_code esdt::config_change( const call_input& input )
{
  if( input.caller != _owner_address )
    return fail( return_code::user_error, "configChange can be called by whitelisted address only" );

  if( input.call_value != 0 )
    return fail( return_code::user_error, "callValue must be 0" );

  if( auto error = _system->use_gas( _gas_cost.esdt_operations ); error )
    return fail( return_code::out_of_gas, error.message() );

  if( input.arguments.size() != 4 )
    return fail( return_code::user_error, make_error_code( contract_errc::invalid_number_of_arguments ).message() );

  if( input.arguments[ 0 ].size() != input.recipient.size() )
    return fail( return_code::user_error, "invalid arguments, first argument must be a valid address" );

  auto min_length = to_amount( input.arguments[ 2 ] );
  auto max_length = to_amount( input.arguments[ 3 ] );

  if( max_length > std::numeric_limits< std::uint32_t >::max() || min_length > max_length )
    return fail( return_code::user_error, make_error_code( contract_errc::invalid_token_name_bounds ).message() );

  esdt_config config;
  config.owner_address         = input.arguments[ 0 ];
  config.base_issuing_cost     = to_amount( input.arguments[ 1 ] );
  config.min_token_name_length = min_length.convert_to< std::uint32_t >();
  config.max_token_name_length = max_length.convert_to< std::uint32_t >();

  save_config( config );

  return return_code::ok;
}

return_code esdt::control_changes( const call_input& input )
{
  if( input.arguments.size() < 2 )
    return fail( return_code::function_wrong_signature, "not enough arguments" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  if( !token.upgradable )
    return fail( return_code::user_error, "token is not upgradable" );

  auto arguments = std::span< const std::string >( input.arguments ).subspan( 1 );
  if( auto error = apply_properties( token, arguments ); error )
    return fail( return_code::user_error, error.message() );

  save_token( token );

  return return_code::ok;
}

return_code esdt::transfer_ownership( const call_input& input )
{
  if( input.arguments.size() != 2 )
    return fail( return_code::function_wrong_signature, "expected num of arguments 2" );

  token_data token;
  if( auto code = basic_ownership_checks( input, token ); code != return_code::ok )
    return code;

  if( !token.can_change_owner )
    return fail( return_code::user_error, "cannot change owner of the token" );

  if( input.arguments[ 1 ].size() != input.caller.size() )
    return fail( return_code::user_error, "destination address of invalid length" );

  token.owner_address = input.arguments[ 1 ];
  save_token( token );

  return return_code::ok;
}

return_code esdt::get_all_tokens( const call_input& input )
{
  if( input.call_value != 0 )
    return fail( return_code::user_error, "callValue must be 0" );

  if( !input.arguments.empty() )
    return fail( return_code::user_error, make_error_code( contract_errc::invalid_number_of_arguments ).message() );

  if( auto error = _system->use_gas( _gas_cost.esdt_operations ); error )
    return fail( return_code::out_of_gas, error.message() );

  auto list = _system->get_storage( memory::as_bytes( issued_tokens_key ) );

  boost::multiprecision::uint128_t copy_cost  = _gas_cost.data_copy_per_byte;
  copy_cost                                  *= list.size();

  if( copy_cost > std::numeric_limits< std::uint64_t >::max() )
    return fail( return_code::user_error, "not enough gas" );

  if( auto error = _system->use_gas( copy_cost.convert_to< std::uint64_t >() ); error )
    return fail( return_code::user_error, error.message() );

  _system->finish( list );

  return return_code::ok;
}

return_code esdt::get_token_properties( const call_input& input )
{
  if( input.call_value != 0 )
    return fail( return_code::user_error, "callValue must be 0" );

  if( input.arguments.size() != 1 )
    return fail( return_code::user_error, make_error_code( contract_errc::invalid_number_of_arguments ).message() );

  if( auto error = _system->use_gas( _gas_cost.esdt_operations ); error )
    return fail( return_code::out_of_gas, error.message() );

  auto token = get_existing_token( input.arguments[ 0 ] );
  if( !token )
    return fail( return_code::user_error, token.error().message() );

  const std::array< std::string, 12 > properties{ token->token_name,
                                                  token->owner_address,
                                                  token->minted_value.str(),
                                                  token->burnt_value.str(),
                                                  labeled( "IsPaused", token->is_paused ),
                                                  labeled( "CanUpgrade", token->upgradable ),
                                                  labeled( "CanMint", token->mintable ),
                                                  labeled( "CanBurn", token->burnable ),
                                                  labeled( "CanChangeOwner", token->can_change_owner ),
                                                  labeled( "CanPause", token->can_pause ),
                                                  labeled( "CanFreeze", token->can_freeze ),
                                                  labeled( "CanWipe", token->can_wipe ) };

  for( const auto& property: properties )
    _system->finish( memory::as_bytes( property ) );

  return return_code::ok;
}

result< token_data > esdt::get_existing_token( std::string_view token_name )
{
  auto bytes = _system->get_storage( memory::as_bytes( token_name ) );
  if( bytes.empty() )
    return std::unexpected( contract_errc::no_such_token );

  return unmarshal_token( bytes );
}

void esdt::save_token( const token_data& token )
{
  _system->set_storage( memory::as_bytes( token.token_name ), marshal( token ) );
}

esdt_config esdt::default_config() const
{
  esdt_config config;
  config.owner_address         = _owner_address;
  config.base_issuing_cost     = _base_issuing_cost;
  config.min_token_name_length = _min_token_name_length;
  config.max_token_name_length = _max_token_name_length;
  return config;
}

result< esdt_config > esdt::get_config()
{
  auto bytes = _system->get_storage( memory::as_bytes( config_key ) );
  if( bytes.empty() )
    return default_config();

  return unmarshal_config( bytes );
}

void esdt::save_config( const esdt_config& config )
{
  _system->set_storage( memory::as_bytes( config_key ), marshal( config ) );
}

return_code esdt::fail( return_code code, std::string_view message )
{
  _system->add_return_message( message );
  return code;
}

} // namespace tessera::contract
