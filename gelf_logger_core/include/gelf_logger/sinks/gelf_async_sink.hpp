#pragma once
#include <chrono>

#include "../config.hpp"
#include "../transport/udp_transport.hpp"
#include "../worker_pool.hpp"
#include "sink_interface.hpp"

namespace gelf_logger
{

// Hands events to a WorkerPool and returns immediately.
class GelfAsyncSink : public ILogSink
{
 public:
  explicit GelfAsyncSink(ConfigPtr config, TransportFactory factory = udp_transport_factory());
  ~GelfAsyncSink() override;

  void Submit(const LogEvent& event) override;
  void Flush() override;

  void Configure(ConfigPtr config);
  void Stop();

  WorkerPool& Pool() { return pool_; }
  const WorkerPool& Pool() const { return pool_; }

  static constexpr std::chrono::milliseconds kFlushTimeout{5000};

 private:
  WorkerPool pool_;
};

}  // namespace gelf_logger
