// NOLINTBEGIN

#include <gtest/gtest.h>

#include <tessera/log.hpp>
#include <tessera/memory.hpp>
#include <test/fixture.hpp>

#include <algorithm>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using tessera::contract::return_code;

class integration: public ::testing::Test,
                   public test::fixture
{
public:
  integration():
      test::fixture( "integration", "debug" ),
      alice( make_address( 'a' ) ),
      bob( make_address( 'b' ) )
  {}

  integration( const integration& ) = delete;
  integration( integration&& )      = delete;

  ~integration() override = default;

  integration& operator=( const integration& ) = delete;
  integration& operator=( integration&& )      = delete;

  static tessera::heartbeat::public_key make_key( std::uint8_t id )
  {
    return tessera::heartbeat::public_key( 33, std::byte{ id } );
  }

  tessera::contract::address alice;
  tessera::contract::address bob;
};

TEST_F( integration, issue_through_vm )
{
  _context->set_balance( alice, 5'000 );

  auto output = issue( alice, "ABC123", 1'000 );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;

  EXPECT_EQ( _context->get_balance( alice ), 4'000 );
  EXPECT_EQ( _context->get_balance( _esdt_address ), 1'000 );

  ASSERT_EQ( output.transfers.size(), 1 );
  EXPECT_EQ( output.transfers[ 0 ].sender, _esdt_address );
  EXPECT_EQ( output.transfers[ 0 ].destination, alice );
  EXPECT_EQ( tessera::memory::as_string_view( output.transfers[ 0 ].data ), "ESDTTransfer@414243313233@03e8" );

  EXPECT_EQ( token( "ABC123" ).owner_address, alice );
  EXPECT_EQ( token( "ABC123" ).minted_value, 1'000 );
  EXPECT_EQ( issued_tokens(), "ABC123" );
}

TEST_F( integration, failed_call_keeps_value )
{
  auto output = issue( bob, "ABC123", 1'000 );
  EXPECT_EQ( output.code, return_code::out_of_funds );
  EXPECT_TRUE( issued_tokens().empty() );

  _context->set_balance( alice, 1'000 );

  output = issue( alice, "AB_C", 1'000 );
  EXPECT_EQ( output.code, return_code::user_error );
  EXPECT_EQ( _context->get_balance( alice ), 1'000 );
  EXPECT_EQ( _context->get_balance( _esdt_address ), 0 );

  output = issue( alice, "ABC123", 1'000 );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;

  output = issue( alice, "ABC123", 1'000 );
  EXPECT_EQ( output.code, return_code::out_of_funds );
  EXPECT_EQ( _context->get_balance( alice ), 0 );
  EXPECT_EQ( _context->get_balance( _esdt_address ), 1'000 );
}

TEST_F( integration, unknown_contract )
{
  auto input      = make_call( alice, "issue", { "ABC123", amount( 1'000 ) }, _base_issuing_cost );
  input.recipient = make_address( 'z' );

  auto output = _vm->run_smart_contract_call( input );
  EXPECT_EQ( output.code, return_code::contract_not_found );
  EXPECT_EQ( output.return_message, "unknown system smart contract" );
  EXPECT_EQ( output.gas_remaining, default_gas );
}

TEST_F( integration, vm_lifecycle )
{
  auto vm = tessera::vm::system_vm::create( nullptr );
  ASSERT_FALSE( vm );
  EXPECT_EQ( vm.error(), tessera::vm::vm_errc::missing_context );

  EXPECT_EQ( _vm->deploy( _esdt_address, _esdt ), tessera::vm::vm_errc::already_deployed );
  EXPECT_EQ( _vm->get_contract( _esdt_address ), _esdt );
  EXPECT_EQ( _vm->get_contract( alice ), nullptr );
  EXPECT_EQ( _vm->context(), _context );

  auto output = _vm->run_smart_contract_create( make_call( _owner, "issue" ) );
  EXPECT_EQ( output.code, return_code::user_error );
  EXPECT_EQ( output.return_message, "ESDT SC already initialized" );
}

TEST_F( integration, claim_collected_fees )
{
  _context->set_balance( alice, 1'000 );
  _context->set_balance( bob, 1'000 );

  ASSERT_EQ( issue( alice, "ABC123", 100 ).code, return_code::ok );
  ASSERT_EQ( issue( bob, "XYZ789", 100 ).code, return_code::ok );
  EXPECT_EQ( _context->get_balance( _esdt_address ), 2'000 );

  auto output = call( alice, "claim" );
  EXPECT_EQ( output.code, return_code::user_error );

  output = call( _owner, "claim" );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;
  EXPECT_EQ( _context->get_balance( _owner ), 2'000 );
  EXPECT_EQ( _context->get_balance( _esdt_address ), 0 );

  output = call( alice, "getAllESDTTokens" );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;
  ASSERT_EQ( output.return_data.size(), 1 );
  EXPECT_EQ( tessera::memory::as_string_view( output.return_data[ 0 ] ), "ABC123@XYZ789" );
}

TEST_F( integration, token_lifecycle )
{
  _context->set_balance( alice, 1'000 );

  ASSERT_EQ( issue( alice,
                    "LIFE01",
                    1'000,
                    { "canBurn", "true", "canMint", "true", "canPause", "true", "canChangeOwner", "true" } )
               .code,
             return_code::ok );

  EXPECT_EQ( call( alice, "mint", { "LIFE01", amount( 500 ), bob } ).code, return_code::ok );
  EXPECT_EQ( call( bob, "ESDTBurn", { "LIFE01", amount( 200 ) } ).code, return_code::ok );
  EXPECT_EQ( call( alice, "pause", { "LIFE01" } ).code, return_code::ok );
  EXPECT_EQ( call( alice, "transferOwnership", { "LIFE01", bob } ).code, return_code::ok );
  EXPECT_EQ( call( alice, "unPause", { "LIFE01" } ).code, return_code::user_error );
  EXPECT_EQ( call( bob, "unPause", { "LIFE01" } ).code, return_code::ok );

  auto t = token( "LIFE01" );
  EXPECT_EQ( t.owner_address, bob );
  EXPECT_EQ( t.minted_value, 1'500 );
  EXPECT_EQ( t.burnt_value, 200 );
  EXPECT_FALSE( t.is_paused );
}

TEST_F( integration, enabled_by_epoch )
{
  auto address  = make_address( '\x02' );
  address[ 30 ] = '\xff';

  tessera::contract::esdt_args args;
  args.system                     = _context;
  args.gas                        = _gas_cost;
  args.settings.owner_address     = _owner;
  args.settings.base_issuing_cost = "0";
  args.settings.enabled_epoch     = 3;
  args.esdt_address               = address;
  args.notifier                   = _notifier;

  auto sc = tessera::contract::esdt::create( args );
  ASSERT_TRUE( sc );
  ASSERT_FALSE( _vm->deploy( address, *sc ) );

  auto input      = make_call( _owner, "" );
  input.recipient = address;
  ASSERT_EQ( _vm->run_smart_contract_create( input ).code, return_code::ok );

  input           = make_call( alice, "issue", { "ABC123", amount( 1'000 ) } );
  input.recipient = address;

  auto output = _vm->run_smart_contract_call( input );
  EXPECT_EQ( output.code, return_code::user_error );
  EXPECT_EQ( output.return_message, "ESDT SC disabled" );

  _notifier->confirm_epoch( 2 );
  EXPECT_FALSE( ( *sc )->enabled() );

  _notifier->confirm_epoch( 3 );
  EXPECT_TRUE( ( *sc )->enabled() );
  EXPECT_TRUE( _esdt->enabled() );

  output = _vm->run_smart_contract_call( input );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;

  // Storage of the two deployments is disjoint
  EXPECT_TRUE( issued_tokens().empty() );
}

TEST_F( integration, gas_schedule_update )
{
  _context->set_balance( alice, 2'000 );

  auto cost       = _gas_cost;
  cost.esdt_issue = default_gas + 1;
  _vm->set_new_gas_cost( cost );

  auto output = issue( alice, "ABC123", 1'000 );
  EXPECT_EQ( output.code, return_code::out_of_gas );
  EXPECT_EQ( _context->get_balance( alice ), 2'000 );

  _vm->set_new_gas_cost( _gas_cost );

  output = issue( alice, "ABC123", 1'000 );
  ASSERT_EQ( output.code, return_code::ok ) << output.return_message;
  EXPECT_EQ( output.gas_remaining, default_gas - _gas_cost.esdt_issue );
}

TEST_F( integration, heartbeat_sweep )
{
  auto validator = make_key( 1 );
  auto peer      = make_key( 2 );
  auto registry  = make_registry( { validator } );

  ASSERT_FALSE( registry->on_message( validator, 1, 1, "v1.0.0", "validator" ) );
  ASSERT_FALSE( registry->on_message( peer, 0, 2, "v1.0.1", "observer" ) );

  _clock->advance( std::chrono::seconds( 5 ) );
  ASSERT_FALSE( registry->on_message( peer, 0, 2, "v1.0.1", "observer" ) );

  _clock->advance( std::chrono::seconds( 10 ) );
  registry->reevaluate( _clock->now() );

  EXPECT_EQ( registry->size(), 2 );
  EXPECT_EQ( registry->active_count(), 1 );

  auto v = registry->status( validator );
  ASSERT_TRUE( v );
  EXPECT_TRUE( v->is_validator );
  EXPECT_FALSE( v->is_active );
  EXPECT_EQ( v->total_up_time, std::chrono::seconds( 0 ) );
  EXPECT_EQ( v->total_down_time, std::chrono::seconds( 15 ) );
  EXPECT_EQ( v->max_observed_inactive_gap, std::chrono::seconds( 15 ) );
  EXPECT_EQ( v->display_name, "validator" );

  auto p = registry->status( peer );
  ASSERT_TRUE( p );
  EXPECT_FALSE( p->is_validator );
  EXPECT_TRUE( p->is_active );
  EXPECT_EQ( p->total_up_time, std::chrono::seconds( 15 ) );
  EXPECT_EQ( p->total_down_time, std::chrono::seconds( 0 ) );
  EXPECT_EQ( p->max_observed_inactive_gap, std::chrono::seconds( 10 ) );
  EXPECT_EQ( p->received_shard_id, 2 );
  EXPECT_EQ( p->version_label, "v1.0.1" );

  ASSERT_FALSE( registry->on_message( validator, 1, 1, "v1.0.0", "validator" ) );
  EXPECT_EQ( registry->active_count(), 2 );
}

TEST_F( integration, concurrent_peer_updates )
{
  auto record = tessera::heartbeat::peer_liveness::create( _max_unresponsive_threshold, true, _genesis, _clock );
  ASSERT_TRUE( record );

  auto created = _clock->now();

  std::atomic< bool > running = true;
  std::vector< std::thread > workers;

  for( std::uint32_t i = 0; i < 4; ++i )
  {
    workers.emplace_back(
      [ &, i ]()
      {
        while( running )
          ( *record )->on_message_received( i, i, "v1.0.0", "worker" );
      } );
  }

  for( int step = 0; step < 200; ++step )
  {
    _clock->advance( std::chrono::milliseconds( 50 ) );
    std::this_thread::yield();
  }

  running = false;
  for( auto& worker: workers )
    worker.join();

  auto now = _clock->now();
  ( *record )->reevaluate( now );

  auto status = ( *record )->status();
  EXPECT_EQ( status.total_up_time + status.total_down_time, now - created );
  EXPECT_LE( status.last_message_timestamp, now );
  EXPECT_LE( status.max_observed_inactive_gap, now - created );
  EXPECT_LT( status.computed_shard_id, 4 );
}

TEST_F( integration, concurrent_registry_updates )
{
  constexpr std::uint8_t key_count = 16;

  std::set< tessera::heartbeat::public_key > validators;
  for( std::uint8_t k = 0; k < 4; ++k )
    validators.insert( make_key( k ) );

  auto registry = make_registry( validators );

  std::vector< std::thread > workers;
  for( int t = 0; t < 8; ++t )
  {
    workers.emplace_back(
      [ & ]()
      {
        for( int i = 0; i < 200; ++i )
          for( std::uint8_t k = 0; k < key_count; ++k )
            EXPECT_FALSE( registry->on_message( make_key( k ), k, k, "v1.0.0", "peer" ) );
      } );
  }

  workers.emplace_back(
    [ & ]()
    {
      for( int i = 0; i < 200; ++i )
      {
        registry->reevaluate( _clock->now() );
        registry->snapshot();
      }
    } );

  for( auto& worker: workers )
    worker.join();

  registry->reevaluate( _clock->now() );

  EXPECT_EQ( registry->size(), key_count );
  EXPECT_EQ( registry->active_count(), key_count );

  auto snapshot = registry->snapshot();
  ASSERT_EQ( snapshot.size(), key_count );

  for( std::uint8_t k = 0; k < key_count; ++k )
  {
    EXPECT_EQ( snapshot[ k ].public_key, make_key( k ) );
    EXPECT_EQ( snapshot[ k ].is_validator, k < 4 );
    EXPECT_EQ( snapshot[ k ].computed_shard_id, k );
  }
}

TEST_F( integration, concurrent_calls_and_gas_updates )
{
  constexpr int thread_count      = 4;
  constexpr int tokens_per_thread = 25;

  std::vector< tessera::contract::address > issuers;
  for( int t = 0; t < thread_count; ++t )
  {
    issuers.emplace_back( make_address( static_cast< char >( 'a' + t ) ) );
    _context->set_balance( issuers.back(), _base_issuing_cost * tokens_per_thread );
  }

  std::atomic< bool > running = true;
  std::atomic< int > failures = 0;

  std::thread gas_updater(
    [ & ]()
    {
      auto cost = _gas_cost;
      while( running )
      {
        cost.esdt_issue = cost.esdt_issue == 100 ? 200 : 100;
        _vm->set_new_gas_cost( cost );
        std::this_thread::yield();
      }
    } );

  std::vector< std::thread > workers;
  for( int t = 0; t < thread_count; ++t )
  {
    workers.emplace_back(
      [ &, t ]()
      {
        for( int i = 0; i < tokens_per_thread; ++i )
        {
          auto name = "T" + std::to_string( t ) + "N" + std::to_string( i );
          if( issue( issuers[ t ], name, 1'000 ).code != return_code::ok )
            ++failures;
        }
      } );
  }

  for( auto& worker: workers )
    worker.join();

  running = false;
  gas_updater.join();

  EXPECT_EQ( failures.load(), 0 );

  auto list = issued_tokens();
  EXPECT_EQ( std::ranges::count( list, '@' ), thread_count * tokens_per_thread - 1 );

  for( int t = 0; t < thread_count; ++t )
  {
    EXPECT_EQ( _context->get_balance( issuers[ t ] ), 0 );

    for( int i = 0; i < tokens_per_thread; ++i )
      EXPECT_EQ( token( "T" + std::to_string( t ) + "N" + std::to_string( i ) ).owner_address, issuers[ t ] );
  }

  tessera::contract::big_integer collected = _base_issuing_cost * thread_count * tokens_per_thread;
  EXPECT_EQ( _context->get_balance( _esdt_address ), collected );
}

// NOLINTEND
