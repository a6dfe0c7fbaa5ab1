#include <tessera/log/log.hpp>

#include <chrono>
#include <mutex>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace tessera::log {

void initialize( quill::LogLevel level ) noexcept
{
  static std::once_flag backend_started;

  std::call_once( backend_started,
                  []()
                  {
                    constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

                    quill::BackendOptions options;
                    options.sleep_duration = sleep_duration;
                    options.error_notifier = []( const std::string& err ) noexcept
                    {
                      LOG_ERROR( tessera::log::instance(), "Encountered backend logging error: {}", err );
                    };

                    quill::Backend::start( options );
                  } );

  instance()->set_log_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace tessera::log
