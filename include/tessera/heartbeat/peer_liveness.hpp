#pragma once

#include <tessera/heartbeat/clock.hpp>
#include <tessera/heartbeat/error.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tessera::heartbeat {

struct peer_status
{
  std::vector< std::byte > public_key;
  time_point last_message_timestamp{};
  bool is_active = false;
  duration max_observed_inactive_gap{};
  duration total_up_time{};
  duration total_down_time{};
  std::uint32_t received_shard_id = 0;
  std::uint32_t computed_shard_id = 0;
  std::string version_label;
  std::string display_name;
  bool is_validator = false;
};

/**
 * peer_liveness retains the liveness bookkeeping of one remote peer.
 *
 * The record is mutated by two entry points, on_message_received() when a
 * heartbeat arrives and reevaluate() on the periodic sweep. Both, and every
 * accessor, run under the same exclusive lock so an interval is settled
 * exactly once.
 *
 * Up time and down time are only accounted from genesis onwards. An interval
 * is credited to up time when the peer was active before and after it was
 * settled, otherwise the whole interval is counted as down time.
 */
class peer_liveness final
{
  struct create_key
  {
    explicit create_key() = default;
  };

public:
  peer_liveness( create_key,
                 duration max_unresponsive_threshold,
                 bool is_validator,
                 time_point genesis_timestamp,
                 std::shared_ptr< const clock > clk );
  peer_liveness( const peer_liveness& ) = delete;
  peer_liveness( peer_liveness&& )      = delete;
  ~peer_liveness()                      = default;

  peer_liveness& operator=( const peer_liveness& ) = delete;
  peer_liveness& operator=( peer_liveness&& )      = delete;

  static result< std::unique_ptr< peer_liveness > > create( duration max_unresponsive_threshold,
                                                            bool is_validator,
                                                            time_point genesis_timestamp,
                                                            std::shared_ptr< const clock > clk );

  /**
   * Record a heartbeat from the peer. The peer is active afterwards.
   */
  void on_message_received( std::uint32_t computed_shard_id,
                            std::uint32_t received_shard_id,
                            const std::string& version_label,
                            const std::string& display_name );

  /**
   * Deactivate the peer if it has been silent for longer than the threshold
   * and settle the elapsed interval.
   */
  void reevaluate( time_point now );

  peer_status status() const;

  duration max_unresponsive_threshold() const noexcept;
  time_point genesis_timestamp() const noexcept;
  bool is_validator() const noexcept;

  time_point last_message_timestamp() const;
  time_point last_transition_timestamp() const;
  bool is_active() const;
  duration max_observed_inactive_gap() const;
  duration total_up_time() const;
  duration total_down_time() const;
  std::uint32_t received_shard_id() const;
  std::uint32_t computed_shard_id() const;
  std::string version_label() const;
  std::string display_name() const;

private:
  bool within_threshold( time_point now ) const noexcept;
  void update_times( time_point now, bool previously_active ) noexcept;
  void update_max_inactive_gap( time_point now ) noexcept;
  void settle( bool previously_active, time_point now ) noexcept;

  const duration _max_unresponsive_threshold;
  const bool _is_validator;
  const time_point _genesis_timestamp;
  const std::shared_ptr< const clock > _clock;

  mutable std::mutex _mutex;

  time_point _last_message_timestamp;
  time_point _last_transition_timestamp;
  bool _is_active = false;
  duration _max_observed_inactive_gap{};
  duration _total_up_time{};
  duration _total_down_time{};
  std::uint32_t _received_shard_id = 0;
  std::uint32_t _computed_shard_id = 0;
  std::string _version_label;
  std::string _display_name;
};

} // namespace tessera::heartbeat
