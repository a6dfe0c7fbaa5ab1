#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace tessera::contract {

struct epoch_subscriber
{
  epoch_subscriber()                          = default;
  epoch_subscriber( const epoch_subscriber& ) = delete;
  epoch_subscriber( epoch_subscriber&& )      = delete;
  virtual ~epoch_subscriber()                 = default;

  epoch_subscriber& operator=( const epoch_subscriber& ) = delete;
  epoch_subscriber& operator=( epoch_subscriber&& )      = delete;

  virtual void epoch_confirmed( std::uint32_t epoch ) = 0;
};

/**
 * Observer list owned by the epoch authority.
 *
 * Subscribers are held weakly and are notified of the current epoch as soon
 * as they register. Notifications run outside of the internal lock, so a
 * subscriber may register further subscribers from its callback.
 */
class epoch_notifier final
{
public:
  epoch_notifier()                        = default;
  epoch_notifier( const epoch_notifier& ) = delete;
  epoch_notifier( epoch_notifier&& )      = delete;
  ~epoch_notifier()                       = default;

  epoch_notifier& operator=( const epoch_notifier& ) = delete;
  epoch_notifier& operator=( epoch_notifier&& )      = delete;

  void register_handler( const std::shared_ptr< epoch_subscriber >& subscriber );
  void confirm_epoch( std::uint32_t epoch );

  std::uint32_t current_epoch() const;
  std::size_t subscriber_count() const;

private:
  mutable std::mutex _mutex;
  std::uint32_t _current_epoch = 0;
  std::vector< std::weak_ptr< epoch_subscriber > > _subscribers;
};

} // namespace tessera::contract
