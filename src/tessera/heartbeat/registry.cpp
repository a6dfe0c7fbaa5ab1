#include <tessera/heartbeat/registry.hpp>
#include <tessera/log.hpp>

#include <algorithm>
#include <mutex>

namespace tessera::heartbeat {

result< std::unique_ptr< registry > > registry::create( duration max_unresponsive_threshold,
                                                        time_point genesis_timestamp,
                                                        std::shared_ptr< const clock > clk,
                                                        std::set< public_key > validators )
{
  if( max_unresponsive_threshold <= duration::zero() )
    return std::unexpected( heartbeat_errc::invalid_threshold );

  if( !clk )
    return std::unexpected( heartbeat_errc::missing_clock );

  return std::make_unique< registry >( create_key{},
                                      max_unresponsive_threshold,
                                      genesis_timestamp,
                                      std::move( clk ),
                                      std::move( validators ) );
}

registry::registry( create_key,
                    duration max_unresponsive_threshold,
                    time_point genesis_timestamp,
                    std::shared_ptr< const clock > clk,
                    std::set< public_key > validators ):
    _max_unresponsive_threshold( max_unresponsive_threshold ),
    _genesis_timestamp( genesis_timestamp ),
    _clock( std::move( clk ) ),
    _validators( std::move( validators ) )
{}

result< peer_liveness* > registry::get_or_create( std::span< const std::byte > key, bool is_validator )
{
  public_key k( key.begin(), key.end() );

  {
    std::shared_lock lock( _mutex );
    if( auto itr = _records.find( k ); itr != _records.end() )
      return itr->second.get();
  }

  std::unique_lock lock( _mutex );

  if( auto itr = _records.find( k ); itr != _records.end() )
    return itr->second.get();

  auto record = peer_liveness::create( _max_unresponsive_threshold, is_validator, _genesis_timestamp, _clock );
  if( !record )
    return std::unexpected( record.error() );

  LOG_DEBUG( tessera::log::instance(),
             "Tracking peer - Public key: {}, Validator: {}",
             tessera::log::hex{ key.data(), key.size() },
             is_validator );

  auto [ itr, inserted ] = _records.emplace( std::move( k ), std::move( *record ) );
  return itr->second.get();
}

std::error_code registry::track( std::span< const std::byte > key, bool is_validator )
{
  if( auto record = get_or_create( key, is_validator ); !record )
    return record.error();

  return heartbeat_errc::ok;
}

std::error_code registry::on_message( std::span< const std::byte > key,
                                      std::uint32_t computed_shard_id,
                                      std::uint32_t received_shard_id,
                                      const std::string& version_label,
                                      const std::string& display_name )
{
  auto record = get_or_create( key, is_validator( key ) );
  if( !record )
    return record.error();

  ( *record )->on_message_received( computed_shard_id, received_shard_id, version_label, display_name );

  return heartbeat_errc::ok;
}

void registry::reevaluate( time_point now )
{
  std::shared_lock lock( _mutex );

  for( auto& [ key, record ]: _records )
    record->reevaluate( now );
}

std::optional< peer_status > registry::status( std::span< const std::byte > key ) const
{
  std::shared_lock lock( _mutex );

  auto itr = _records.find( public_key( key.begin(), key.end() ) );
  if( itr == _records.end() )
    return {};

  auto s       = itr->second->status();
  s.public_key = itr->first;
  return s;
}

std::vector< peer_status > registry::snapshot() const
{
  std::shared_lock lock( _mutex );

  std::vector< peer_status > statuses;
  statuses.reserve( _records.size() );

  for( const auto& [ key, record ]: _records )
  {
    auto& s      = statuses.emplace_back( record->status() );
    s.public_key = key;
  }

  return statuses;
}

std::size_t registry::size() const
{
  std::shared_lock lock( _mutex );
  return _records.size();
}

std::size_t registry::active_count() const
{
  std::shared_lock lock( _mutex );

  return std::ranges::count_if( _records,
                                []( const auto& entry )
                                {
                                  return entry.second->is_active();
                                } );
}

bool registry::is_validator( std::span< const std::byte > key ) const
{
  return _validators.contains( public_key( key.begin(), key.end() ) );
}

} // namespace tessera::heartbeat
