#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "log_event.hpp"
#include "transport/udp_transport.hpp"

namespace gelf_logger
{

enum class SendStatus : uint8_t
{
  Sent,         // single datagram
  SentChunked,  // chunk sequence
  Skipped,      // empty formatted message
  Dropped       // above GELF_LOG_MAX_SIZE under OversizePolicy::Drop
};

struct SenderStats
{
  uint64_t sent = 0;
  uint64_t sent_chunked = 0;
  uint64_t chunks = 0;
  uint64_t skipped = 0;
  uint64_t dropped_oversize = 0;
};

// Build, encode and compress. nullopt means the event is skipped.
// Encoder and codec errors propagate.
std::optional<std::string> serialize_event(const LogEvent& event, const Config& config);

// One event at a time from document to wire. Owns exactly one transport,
// opened on the first send and kept until Reconfigure() or destruction.
// Not thread-safe; each worker owns its own sender.
class GelfSender
{
 public:
  GelfSender(ConfigPtr config, TransportFactory factory);

  GelfSender(const GelfSender&) = delete;
  GelfSender& operator=(const GelfSender&) = delete;

  // Throws EncodeError, CompressionError, MessageTooLargeError (Fail policy)
  // and TransportError. Nothing is retried.
  SendStatus Send(const LogEvent& event);

  // Sends an already compressed payload through the size policy.
  SendStatus Transmit(std::string_view payload);

  // Closes the current socket; the next send opens one for `config`.
  void Reconfigure(ConfigPtr config);

  const ConfigPtr& GetConfig() const { return config_; }
  const SenderStats& Stats() const { return stats_; }
  bool HasTransport() const { return transport_ != nullptr; }

 private:
  ConfigPtr config_;
  TransportFactory factory_;
  std::unique_ptr<IDatagramTransport> transport_;
  SenderStats stats_;

  IDatagramTransport& EnsureTransport();
};

}  // namespace gelf_logger
