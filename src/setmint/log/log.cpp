#include <setmint/log/log.hpp>

#include <chrono>
#include <stdexcept>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/ConsoleSink.h>

namespace setmint::log {

static quill::LogLevel parse_level( const std::string& level )
{
  if( level == "trace" )
    return quill::LogLevel::TraceL1;
  if( level == "warning" )
    return quill::LogLevel::Warning;

  try
  {
    return quill::loglevel_from_string( level );
  }
  catch( const std::exception& )
  {
    throw std::invalid_argument( "invalid log level: " + level );
  }
}

void initialize( const std::string& level )
{
  auto log_level = parse_level( level );

  if( !quill::Backend::is_running() )
  {
    constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

    quill::BackendOptions options;
    options.sleep_duration = sleep_duration;
    options.error_notifier = []( const std::string& err ) noexcept
    {
      LOG_ERROR( setmint::log::instance(), "Encountered backend logging error: {}", err );
    };

    quill::Backend::start( options );
  }

  instance()->set_log_level( log_level );
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

} // namespace setmint::log
