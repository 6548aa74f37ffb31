#include "gelf_logger/sinks/gelf_sink.hpp"
#include "gelf_logger/errors.hpp"

#include <fmt/format.h>

namespace gelf_logger {

GelfSink::GelfSink(ConfigPtr config, TransportFactory factory)
    : sender_(std::move(config), std::move(factory)) {
    SetLevel(sender_.GetConfig()->min_level.value_or(Severity::Debug));
}

void GelfSink::Submit(const LogEvent& event) {
    if (!ShouldLog(event.level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        sender_.Send(event);
    } catch (const TransportError& e) {
        ++transport_failures_;
        fmt::print(stderr, "GelfSink: transport failure: {}\n", e.what());
        sender_.Reconfigure(sender_.GetConfig());
    }
}

void GelfSink::Flush() {
}

void GelfSink::Configure(ConfigPtr config) {
    std::lock_guard<std::mutex> lock(mutex_);
    SetLevel(config->min_level.value_or(Severity::Debug));
    sender_.Reconfigure(std::move(config));
}

SenderStats GelfSink::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sender_.Stats();
}

uint64_t GelfSink::TransportFailures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_failures_;
}

} // namespace gelf_logger
