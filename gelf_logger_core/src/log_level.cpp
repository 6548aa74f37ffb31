#include "gelf_logger/log_level.hpp"

namespace gelf_logger {

std::optional<Severity> parse_severity(std::string_view name) {
    if (name == "debug")     return Severity::Debug;
    if (name == "info")      return Severity::Info;
    if (name == "notice")    return Severity::Notice;
    if (name == "warning")   return Severity::Warning;
    if (name == "warn")      return Severity::Warning;
    if (name == "error")     return Severity::Error;
    if (name == "critical")  return Severity::Critical;
    if (name == "alert")     return Severity::Alert;
    if (name == "emergency") return Severity::Emergency;
    return std::nullopt;
}

} // namespace gelf_logger
