#pragma once

#include <tessera/heartbeat/clock.hpp>
#include <tessera/heartbeat/error.hpp>
#include <tessera/heartbeat/peer_liveness.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace tessera::heartbeat {

using public_key = std::vector< std::byte >;

/**
 * registry owns one peer_liveness per public key.
 *
 * Records are created on first contact (or explicitly through track()) and
 * are never removed; pruning peers is a policy of the caller. The key map is
 * guarded by a reader/writer lock where only record creation is a writer, the
 * records themselves serialize their own updates.
 */
class registry final
{
  struct create_key
  {
    explicit create_key() = default;
  };

public:
  registry( create_key,
            duration max_unresponsive_threshold,
            time_point genesis_timestamp,
            std::shared_ptr< const clock > clk,
            std::set< public_key > validators );
  registry( const registry& ) = delete;
  registry( registry&& )      = delete;
  ~registry()                 = default;

  registry& operator=( const registry& ) = delete;
  registry& operator=( registry&& )      = delete;

  static result< std::unique_ptr< registry > > create( duration max_unresponsive_threshold,
                                                       time_point genesis_timestamp,
                                                       std::shared_ptr< const clock > clk,
                                                       std::set< public_key > validators = {} );

  std::error_code track( std::span< const std::byte > key, bool is_validator );

  std::error_code on_message( std::span< const std::byte > key,
                              std::uint32_t computed_shard_id,
                              std::uint32_t received_shard_id,
                              const std::string& version_label,
                              const std::string& display_name );

  void reevaluate( time_point now );

  std::optional< peer_status > status( std::span< const std::byte > key ) const;
  std::vector< peer_status > snapshot() const;

  std::size_t size() const;
  std::size_t active_count() const;

  bool is_validator( std::span< const std::byte > key ) const;

private:
  result< peer_liveness* > get_or_create( std::span< const std::byte > key, bool is_validator );

  const duration _max_unresponsive_threshold;
  const time_point _genesis_timestamp;
  const std::shared_ptr< const clock > _clock;
  const std::set< public_key > _validators;

  mutable std::shared_mutex _mutex;
  std::map< public_key, std::unique_ptr< peer_liveness > > _records;
};

} // namespace tessera::heartbeat
