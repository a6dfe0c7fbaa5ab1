#include <tessera/contract/epoch_notifier.hpp>
#include <tessera/log.hpp>

#include <algorithm>

namespace tessera::contract {

void epoch_notifier::register_handler( const std::shared_ptr< epoch_subscriber >& subscriber )
{
  if( !subscriber )
    return;

  std::uint32_t epoch = 0;

  {
    std::lock_guard lock( _mutex );
    _subscribers.emplace_back( subscriber );
    epoch = _current_epoch;
  }

  subscriber->epoch_confirmed( epoch );
}

void epoch_notifier::confirm_epoch( std::uint32_t epoch )
{
  std::vector< std::shared_ptr< epoch_subscriber > > subscribers;

  {
    std::lock_guard lock( _mutex );
    _current_epoch = epoch;

    std::erase_if( _subscribers,
                   []( const auto& s )
                   {
                     return s.expired();
                   } );

    for( const auto& s: _subscribers )
      if( auto subscriber = s.lock() )
        subscribers.emplace_back( std::move( subscriber ) );
  }

  LOG_DEBUG( tessera::log::instance(), "Epoch confirmed - Epoch: {}, Subscribers: {}", epoch, subscribers.size() );

  for( const auto& subscriber: subscribers )
    subscriber->epoch_confirmed( epoch );
}

std::uint32_t epoch_notifier::current_epoch() const
{
  std::lock_guard lock( _mutex );
  return _current_epoch;
}

std::size_t epoch_notifier::subscriber_count() const
{
  std::lock_guard lock( _mutex );

  return std::ranges::count_if( _subscribers,
                                []( const auto& s )
                                {
                                  return !s.expired();
                                } );
}

} // namespace tessera::contract
