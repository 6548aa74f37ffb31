#pragma once
#include <cstdint>
#include <mutex>

#include "../config.hpp"
#include "../gelf_sender.hpp"
#include "../transport/udp_transport.hpp"
#include "sink_interface.hpp"

namespace gelf_logger
{

// Sends in the caller's thread. Encoding errors reach the caller; a
// transport error is reported, the event is dropped and the socket is
// reopened on the next event.
class GelfSink : public ILogSink
{
 public:
  explicit GelfSink(ConfigPtr config, TransportFactory factory = udp_transport_factory());

  void Submit(const LogEvent& event) override;
  void Flush() override;

  // Closes the socket and adopts the new snapshot.
  void Configure(ConfigPtr config);

  SenderStats Stats() const;
  uint64_t TransportFailures() const;

 private:
  mutable std::mutex mutex_;
  GelfSender sender_;
  uint64_t transport_failures_ = 0;
};

}  // namespace gelf_logger
