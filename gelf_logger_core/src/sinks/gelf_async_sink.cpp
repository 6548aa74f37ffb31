#include "gelf_logger/sinks/gelf_async_sink.hpp"

#include <fmt/format.h>

namespace gelf_logger {

GelfAsyncSink::GelfAsyncSink(ConfigPtr config, TransportFactory factory)
    : pool_(std::move(config), std::move(factory)) {
    SetLevel(pool_.CurrentConfig()->min_level.value_or(Severity::Debug));
}

GelfAsyncSink::~GelfAsyncSink() {
    Stop();
}

void GelfAsyncSink::Submit(const LogEvent& event) {
    if (!ShouldLog(event.level)) {
        return;
    }
    // a full inbox drops the event; the pool counts it
    pool_.Dispatch(event);
}

void GelfAsyncSink::Flush() {
    if (!pool_.WaitIdle(kFlushTimeout)) {
        fmt::print(stderr, "GelfAsyncSink: flush timed out after {} ms\n", kFlushTimeout.count());
    }
}

void GelfAsyncSink::Configure(ConfigPtr config) {
    SetLevel(config->min_level.value_or(Severity::Debug));
    pool_.Reconfigure(std::move(config));
}

void GelfAsyncSink::Stop() {
    pool_.Stop();
}

} // namespace gelf_logger
