#include "gelf_logger/chunker.hpp"

#include <algorithm>
#include <cstring>
#include <random>

namespace gelf_logger {

MessageId generate_message_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t value = rng();
    MessageId id;
    std::memcpy(id.data(), &value, sizeof(value));
    return id;
}

Chunker::Chunker(std::string_view payload, const MessageId& id)
    : payload_(payload)
    , id_(id)
    , total_(chunk_count(payload.size())) {
}

bool Chunker::Next(std::string_view& datagram) {
    if (sequence_ >= total_) {
        return false;
    }

    size_t offset = sequence_ * GELF_LOG_MAX_PAYLOAD_SIZE;
    size_t body = std::min<size_t>(payload_.size() - offset, GELF_LOG_MAX_PAYLOAD_SIZE);

    uint8_t* ptr = buf_;
    *ptr++ = kChunkMagic0;
    *ptr++ = kChunkMagic1;
    std::memcpy(ptr, id_.data(), id_.size());
    ptr += id_.size();
    *ptr++ = static_cast<uint8_t>(sequence_);
    *ptr++ = static_cast<uint8_t>(total_);
    std::memcpy(ptr, payload_.data() + offset, body);

    datagram = std::string_view(reinterpret_cast<const char*>(buf_),
                                GELF_LOG_CHUNK_HEADER_SIZE + body);
    ++sequence_;
    return true;
}

} // namespace gelf_logger
