#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <tessera/config.hpp>
#include <tessera/contract.hpp>
#include <tessera/encode.hpp>
#include <tessera/heartbeat.hpp>
#include <tessera/log.hpp>
#include <tessera/memory.hpp>
#include <tessera/vm.hpp>

namespace constants {

using namespace std::string_literals;

const auto help_option                             = "help,h"s;
const auto version_option                          = "version,v"s;
const auto basedir_option                          = "basedir,d"s;
const auto basedir_default                         = ".tessera"s;
const auto log_level_option                        = "log-level,l"s;
const auto log_level_default                       = "info"s;
const auto sweep_interval_option                   = "sweep-interval"s;
constexpr std::uint64_t sweep_interval_default     = 10'000;
const auto max_unresponsive_option                 = "max-unresponsive"s;
constexpr std::uint64_t max_unresponsive_default   = 60'000;
const auto genesis_time_option                     = "genesis-time"s;
constexpr std::uint64_t genesis_time_default       = 0;
const auto validator_option                        = "validator"s;
const auto esdt_owner_option                       = "esdt-owner"s;
const auto esdt_owner_default                      = ""s;
const auto esdt_base_issuing_cost_option           = "esdt-base-issuing-cost"s;
const auto esdt_base_issuing_cost_default          = "5000000000000000000"s;
const auto esdt_enabled_epoch_option               = "esdt-enabled-epoch"s;
constexpr std::uint32_t esdt_enabled_epoch_default = 0;
const auto epoch_option                            = "epoch"s;
constexpr std::uint32_t epoch_default              = 0;
const auto node_section                            = "node"s;
const auto global_section                          = "global"s;

constexpr std::uint64_t esdt_issue_gas         = 50'000;
constexpr std::uint64_t esdt_operations_gas    = 50'000;
constexpr std::uint64_t data_copy_per_byte_gas = 50;

} // namespace constants

using namespace tessera;

const std::string& version_string();

namespace {

// System smart contract addresses are 32 bytes with the contract id in the
// trailing bytes.
contract::address system_address( char id )
{
  contract::address address( 32, '\0' );
  address[ 30 ] = '\xff';
  address[ 31 ] = id;
  return address;
}

std::vector< std::byte > parse_key( const std::string& hex )
{
  auto bytes = encode::from_hex( hex );
  if( !bytes )
    throw std::runtime_error( "invalid hex value '" + hex + "': " + bytes.error().message() );

  return *bytes;
}

struct sweeper
{
  boost::asio::steady_timer& timer;
  heartbeat::registry& registry;
  const heartbeat::clock& clock;
  std::chrono::milliseconds interval;

  void schedule()
  {
    timer.expires_after( interval );
    timer.async_wait(
      [ this ]( const boost::system::error_code& ec )
      {
        if( ec == boost::asio::error::operation_aborted )
          return;

        registry.reevaluate( clock.now() );

        auto total  = registry.size();
        auto active = registry.active_count();

        if( total )
          LOG_INFO( tessera::log::instance(),
                    "Liveness sweep - Active peers: {}/{} ({})",
                    active,
                    total,
                    log::percent< std::size_t, std::size_t >{ active, total } );
        else
          LOG_INFO( tessera::log::instance(), "Liveness sweep - No peers tracked" );

        schedule();
      } );
  }
};

} // namespace

auto main( int argc, char** argv ) -> int
{
  std::string log_level, esdt_owner, base_issuing_cost;
  std::uint64_t sweep_interval = 0, max_unresponsive = 0, genesis_time = 0;
  std::uint32_t esdt_enabled_epoch = 0, epoch = 0;
  std::set< heartbeat::public_key > validators;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()                  , "Print this help message and exit" )
      ( constants::version_option.data()               , "Print version string and exit" )
      ( constants::basedir_option.data()               , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Tessera base directory" )
      ( constants::log_level_option.data()             , boost::program_options::value< std::string >()               , "The log filtering level" )
      ( constants::sweep_interval_option.data()        , boost::program_options::value< std::uint64_t >()             , "Milliseconds between liveness sweeps" )
      ( constants::max_unresponsive_option.data()      , boost::program_options::value< std::uint64_t >()             , "Milliseconds of silence before a peer is considered inactive" )
      ( constants::genesis_time_option.data()          , boost::program_options::value< std::uint64_t >()             , "Genesis time in milliseconds since the unix epoch" )
      ( constants::validator_option.data()             , boost::program_options::value< std::vector< std::string > >(), "Hex encoded validator public key (repeatable)" )
      ( constants::esdt_owner_option.data()            , boost::program_options::value< std::string >()               , "Hex encoded ESDT contract owner address" )
      ( constants::esdt_base_issuing_cost_option.data(), boost::program_options::value< std::string >()               , "Cost of issuing an ESDT token" )
      ( constants::esdt_enabled_epoch_option.data()    , boost::program_options::value< std::uint32_t >()             , "Epoch from which the ESDT contract is enabled" )
      ( constants::epoch_option.data()                 , boost::program_options::value< std::uint32_t >()             , "Current epoch" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << '\n';
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node root_config;
    YAML::Node global_config;
    YAML::Node node_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      root_config   = YAML::LoadFile( yaml_config.string() );
      global_config = root_config[ constants::global_section ];
      node_config   = root_config[ constants::node_section ];
    }

    // clang-format off
    log_level          = config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, node_config, global_config );
    sweep_interval     = config::get_option< std::uint64_t >( constants::sweep_interval_option, constants::sweep_interval_default, args, node_config, global_config );
    max_unresponsive   = config::get_option< std::uint64_t >( constants::max_unresponsive_option, constants::max_unresponsive_default, args, node_config, global_config );
    genesis_time       = config::get_option< std::uint64_t >( constants::genesis_time_option, constants::genesis_time_default, args, node_config, global_config );
    esdt_owner         = config::get_option< std::string >( constants::esdt_owner_option, constants::esdt_owner_default, args, node_config, global_config );
    base_issuing_cost  = config::get_option< std::string >( constants::esdt_base_issuing_cost_option, constants::esdt_base_issuing_cost_default, args, node_config, global_config );
    esdt_enabled_epoch = config::get_option< std::uint32_t >( constants::esdt_enabled_epoch_option, constants::esdt_enabled_epoch_default, args, node_config, global_config );
    epoch              = config::get_option< std::uint32_t >( constants::epoch_option, constants::epoch_default, args, node_config, global_config );
    // clang-format on

    log::initialize( quill::loglevel_from_string( log_level ) );

    LOG_INFO( tessera::log::instance(), "{}", version_string() );

    if( root_config.IsNull() )
      LOG_WARNING( tessera::log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );

    if( !sweep_interval )
      throw std::runtime_error( "sweep interval must be greater than 0" );

    for( const auto& key: config::get_options< std::string >( constants::validator_option, args, node_config, global_config ) )
      validators.emplace( parse_key( key ) );

    if( !esdt_owner.empty() )
      esdt_owner = std::string( memory::as_string_view( parse_key( esdt_owner ) ) );
  }
  catch( const std::exception& e )
  {
    log::initialize();
    LOG_ERROR( tessera::log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  int retcode = EXIT_SUCCESS;
  std::atomic< bool > stopped = false;
  boost::asio::io_context ioc;

  try
  {
    auto clock   = std::make_shared< heartbeat::system_clock >();
    auto genesis = heartbeat::time_point( std::chrono::milliseconds( genesis_time ) );

    auto registry = heartbeat::registry::create( std::chrono::milliseconds( max_unresponsive ), genesis, clock, validators );
    if( !registry )
      throw std::runtime_error( "unable to create peer registry: " + registry.error().message() );

    for( const auto& key: validators )
      if( auto error = ( *registry )->track( key, true ); error )
        throw std::runtime_error( "unable to track validator: " + error.message() );

    LOG_INFO( tessera::log::instance(),
              "Tracking {} validators - Max unresponsive: {}, Uptime since genesis: {}",
              validators.size(),
              log::duration{ std::chrono::milliseconds( max_unresponsive ) },
              log::duration{ clock->now() - genesis } );

    auto context  = std::make_shared< vm::system_context >();
    auto notifier = std::make_shared< contract::epoch_notifier >();

    contract::esdt_args esdt_args;
    esdt_args.system                     = context;
    esdt_args.gas.esdt_issue             = constants::esdt_issue_gas;
    esdt_args.gas.esdt_operations        = constants::esdt_operations_gas;
    esdt_args.gas.data_copy_per_byte     = constants::data_copy_per_byte_gas;
    esdt_args.settings.owner_address     = esdt_owner;
    esdt_args.settings.base_issuing_cost = base_issuing_cost;
    esdt_args.settings.enabled_epoch     = esdt_enabled_epoch;
    esdt_args.esdt_address               = system_address( 1 );
    esdt_args.notifier                   = notifier;

    auto esdt = contract::esdt::create( esdt_args );
    if( !esdt )
      throw std::runtime_error( "unable to create ESDT contract: " + esdt.error().message() );

    auto system_vm = vm::system_vm::create( context );
    if( !system_vm )
      throw std::runtime_error( "unable to create system VM: " + system_vm.error().message() );

    if( auto error = ( *system_vm )->deploy( esdt_args.esdt_address, *esdt ); error )
      throw std::runtime_error( "unable to deploy ESDT contract: " + error.message() );

    contract::call_input deployment;
    deployment.caller    = esdt_owner;
    deployment.recipient = esdt_args.esdt_address;

    if( auto output = ( *system_vm )->run_smart_contract_create( deployment ); output.code != contract::return_code::ok )
      throw std::runtime_error( "ESDT contract deployment failed: " + output.return_message );

    notifier->confirm_epoch( epoch );

    LOG_INFO( tessera::log::instance(), "ESDT contract enabled: {}", ( *esdt )->enabled() );

    boost::asio::signal_set signals( ioc );
    signals.add( SIGINT );
    signals.add( SIGTERM );
#if defined( SIGQUIT )
    signals.add( SIGQUIT );
#endif

    boost::asio::steady_timer timer( ioc );
    sweeper sweep{ timer, **registry, *clock, std::chrono::milliseconds( sweep_interval ) };

    signals.async_wait(
      [ & ]( const boost::system::error_code& err, int num )
      {
        LOG_INFO( tessera::log::instance(), "Caught signal {}, shutting down...", num );
        stopped = true;
        timer.cancel();
        ioc.stop();
      } );

    sweep.schedule();

    ioc.run();
  }
  catch( const std::exception& e )
  {
    if( !stopped )
    {
      LOG_CRITICAL( tessera::log::instance(), "An unexpected error has occurred: {}", e.what() );
      retcode = EXIT_FAILURE;
    }
  }

  LOG_INFO( tessera::log::instance(), "Shut down gracefully" );

  return retcode;
}

const std::string& version_string()
{
  static std::string v_str = "Tessera Node v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                             + std::to_string( PROJECT_MINOR_VERSION ) + "." + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}
