#include <tessera/heartbeat/peer_liveness.hpp>

#include <algorithm>

namespace tessera::heartbeat {

result< std::unique_ptr< peer_liveness > > peer_liveness::create( duration max_unresponsive_threshold,
                                                                  bool is_validator,
                                                                  time_point genesis_timestamp,
                                                                  std::shared_ptr< const clock > clk )
{
  if( max_unresponsive_threshold <= duration::zero() )
    return std::unexpected( heartbeat_errc::invalid_threshold );

  if( !clk )
    return std::unexpected( heartbeat_errc::missing_clock );

  return std::make_unique< peer_liveness >( create_key{},
                                           max_unresponsive_threshold,
                                           is_validator,
                                           genesis_timestamp,
                                           std::move( clk ) );
}

peer_liveness::peer_liveness( create_key,
                              duration max_unresponsive_threshold,
                              bool is_validator,
                              time_point genesis_timestamp,
                              std::shared_ptr< const clock > clk ):
    _max_unresponsive_threshold( max_unresponsive_threshold ),
    _is_validator( is_validator ),
    _genesis_timestamp( genesis_timestamp ),
    _clock( std::move( clk ) ),
    _last_message_timestamp( genesis_timestamp ),
    _last_transition_timestamp( _clock->now() )
{}

void peer_liveness::on_message_received( std::uint32_t computed_shard_id,
                                         std::uint32_t received_shard_id,
                                         const std::string& version_label,
                                         const std::string& display_name )
{
  std::lock_guard lock( _mutex );

  auto now               = _clock->now();
  bool previously_active = _is_active && within_threshold( now );
  _is_active             = true;

  update_times( now, previously_active );

  _computed_shard_id      = computed_shard_id;
  _received_shard_id      = received_shard_id;
  _last_message_timestamp = now;
  _version_label          = version_label;
  _display_name           = display_name;
}

void peer_liveness::reevaluate( time_point now )
{
  std::lock_guard lock( _mutex );

  _is_active = _is_active && within_threshold( now );
  update_times( now, _is_active );
}

bool peer_liveness::within_threshold( time_point now ) const noexcept
{
  auto silence = std::max( duration::zero(), now - _last_message_timestamp );
  return silence <= _max_unresponsive_threshold;
}

void peer_liveness::update_times( time_point now, bool previously_active ) noexcept
{
  if( now < _genesis_timestamp )
    return;

  update_max_inactive_gap( now );
  settle( previously_active, now );
}

void peer_liveness::update_max_inactive_gap( time_point now ) noexcept
{
  auto gap = std::max( duration::zero(), now - _last_message_timestamp );

  if( gap > _max_observed_inactive_gap && now > _genesis_timestamp )
    _max_observed_inactive_gap = gap;
}

void peer_liveness::settle( bool previously_active, time_point now ) noexcept
{
  if( _last_transition_timestamp < _genesis_timestamp )
    _last_transition_timestamp = _genesis_timestamp;

  auto elapsed = std::max( duration::zero(), now - _last_transition_timestamp );

  if( previously_active && _is_active )
    _total_up_time += elapsed;
  else
    _total_down_time += elapsed;

  _last_transition_timestamp = now;
}

peer_status peer_liveness::status() const
{
  std::lock_guard lock( _mutex );

  peer_status s;
  s.last_message_timestamp    = _last_message_timestamp;
  s.is_active                 = _is_active;
  s.max_observed_inactive_gap = _max_observed_inactive_gap;
  s.total_up_time             = _total_up_time;
  s.total_down_time           = _total_down_time;
  s.received_shard_id         = _received_shard_id;
  s.computed_shard_id         = _computed_shard_id;
  s.version_label             = _version_label;
  s.display_name              = _display_name;
  s.is_validator              = _is_validator;
  return s;
}

duration peer_liveness::max_unresponsive_threshold() const noexcept
{
  return _max_unresponsive_threshold;
}

time_point peer_liveness::genesis_timestamp() const noexcept
{
  return _genesis_timestamp;
}

bool peer_liveness::is_validator() const noexcept
{
  return _is_validator;
}

time_point peer_liveness::last_message_timestamp() const
{
  std::lock_guard lock( _mutex );
  return _last_message_timestamp;
}

time_point peer_liveness::last_transition_timestamp() const
{
  std::lock_guard lock( _mutex );
  return _last_transition_timestamp;
}

bool peer_liveness::is_active() const
{
  std::lock_guard lock( _mutex );
  return _is_active;
}

duration peer_liveness::max_observed_inactive_gap() const
{
  std::lock_guard lock( _mutex );
  return _max_observed_inactive_gap;
}

duration peer_liveness::total_up_time() const
{
  std::lock_guard lock( _mutex );
  return _total_up_time;
}

duration peer_liveness::total_down_time() const
{
  std::lock_guard lock( _mutex );
  return _total_down_time;
}

std::uint32_t peer_liveness::received_shard_id() const
{
  std::lock_guard lock( _mutex );
  return _received_shard_id;
}

std::uint32_t peer_liveness::computed_shard_id() const
{
  std::lock_guard lock( _mutex );
  return _computed_shard_id;
}

std::string peer_liveness::version_label() const
{
  std::lock_guard lock( _mutex );
  return _version_label;
}

std::string peer_liveness::display_name() const
{
  std::lock_guard lock( _mutex );
  return _display_name;
}

} // namespace tessera::heartbeat
