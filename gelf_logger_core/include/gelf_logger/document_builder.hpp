#pragma once
#include <optional>

#include "config.hpp"
#include "gelf_document.hpp"
#include "log_event.hpp"

namespace gelf_logger
{

// Maps an event to its GELF document. Returns nullopt when the formatted
// message is empty, which means the event is skipped.
std::optional<GelfDocument> build_document(const LogEvent& event, const Config& config);

// Runs the configured formatter. A failing callback falls back to the
// default "$message" rendering and is never reported to the caller.
LogEvent apply_formatter(const LogEvent& event, const Config& config);

}  // namespace gelf_logger
