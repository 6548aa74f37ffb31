#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace gelf_logger {

// Ordered from least to most severe so `>=` reads as "at least as severe".
enum class Severity : uint8_t {
    Debug     = 0,
    Info      = 1,
    Notice    = 2,
    Warning   = 3,
    Error     = 4,
    Critical  = 5,
    Alert     = 6,
    Emergency = 7
};

constexpr std::string_view to_string(Severity level) {
    switch (level) {
        case Severity::Debug:     return "debug";
        case Severity::Info:      return "info";
        case Severity::Notice:    return "notice";
        case Severity::Warning:   return "warning";
        case Severity::Error:     return "error";
        case Severity::Critical:  return "critical";
        case Severity::Alert:     return "alert";
        case Severity::Emergency: return "emergency";
    }
    return "unknown";
}

// syslog numeric scale, 0 = most severe
constexpr int to_syslog_code(Severity level) {
    switch (level) {
        case Severity::Debug:     return 7;
        case Severity::Info:      return 6;
        case Severity::Notice:    return 5;
        case Severity::Warning:   return 4;
        case Severity::Error:     return 3;
        case Severity::Critical:  return 2;
        case Severity::Alert:     return 1;
        case Severity::Emergency: return 0;
    }
    return 6;
}

// Longest name, used by the $levelpad template token.
constexpr size_t kMaxSeverityNameLen = 9;

// Accepts the names produced by to_string() plus "warn".
std::optional<Severity> parse_severity(std::string_view name);

} // namespace gelf_logger
