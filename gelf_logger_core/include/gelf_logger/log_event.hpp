#pragma once
#include <string>

#include "log_level.hpp"
#include "metadata.hpp"
#include "timestamp.hpp"

namespace gelf_logger
{

struct LogEvent
{
  Severity level = Severity::Info;
  std::string message;
  Timestamp timestamp{1970, 1, 1, 0, 0, 0, 0};
  Metadata metadata;
};

// Stamps the event with the current UTC wall clock.
LogEvent make_event(Severity level, std::string message, Metadata metadata = {});

}  // namespace gelf_logger
