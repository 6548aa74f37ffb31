#include "gelf_logger/log_event.hpp"

namespace gelf_logger
{

LogEvent make_event(Severity level, std::string message, Metadata metadata)
{
  LogEvent event;
  event.level = level;
  event.message = std::move(message);
  event.timestamp = utc_now();
  event.metadata = std::move(metadata);
  return event;
}

}  // namespace gelf_logger
