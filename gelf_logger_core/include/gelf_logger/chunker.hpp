#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "platform.hpp"

namespace gelf_logger
{

using MessageId = std::array<uint8_t, 8>;

inline constexpr uint8_t kChunkMagic0 = 0x1E;
inline constexpr uint8_t kChunkMagic1 = 0x0F;

// Fresh random id per oversized message.
MessageId generate_message_id();

// ceil(payload_size / GELF_LOG_MAX_PAYLOAD_SIZE)
constexpr size_t chunk_count(size_t payload_size)
{
  return (payload_size + GELF_LOG_MAX_PAYLOAD_SIZE - 1) / GELF_LOG_MAX_PAYLOAD_SIZE;
}

// Splits a payload into GELF chunk datagrams. One instance per message;
// chunks are produced in ascending sequence order into an internal
// datagram buffer that is reused between calls.
class Chunker
{
 public:
  // payload must be at most GELF_LOG_MAX_SIZE bytes.
  Chunker(std::string_view payload, const MessageId& id);

  size_t Total() const { return total_; }

  // Builds the next chunk. Returns false once all chunks were produced.
  bool Next(std::string_view& datagram);

 private:
  std::string_view payload_;
  MessageId id_;
  size_t total_;
  size_t sequence_ = 0;
  uint8_t buf_[GELF_LOG_MAX_PACKET_SIZE];
};

}  // namespace gelf_logger
