#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define GELF_LOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define GELF_LOG_PLATFORM_MACOS 1
#endif

// ===== GELF 尺寸限制 =====
// Largest compressed payload accepted for sending (128 chunks).
#ifndef GELF_LOG_MAX_SIZE
    #define GELF_LOG_MAX_SIZE 1047040
#endif

// Payloads up to this size go out as a single datagram.
#ifndef GELF_LOG_MAX_PACKET_SIZE
    #define GELF_LOG_MAX_PACKET_SIZE 8192
#endif

// Chunk header is 12 bytes: magic(2) + id(8) + seq(1) + total(1)
#ifndef GELF_LOG_CHUNK_HEADER_SIZE
    #define GELF_LOG_CHUNK_HEADER_SIZE 12
#endif

#ifndef GELF_LOG_MAX_PAYLOAD_SIZE
    #define GELF_LOG_MAX_PAYLOAD_SIZE (GELF_LOG_MAX_PACKET_SIZE - GELF_LOG_CHUNK_HEADER_SIZE)
#endif

// ===== 文档字段 =====
#ifndef GELF_LOG_SHORT_MESSAGE_LEN
    #define GELF_LOG_SHORT_MESSAGE_LEN 80
#endif

#ifndef GELF_LOG_DEFAULT_PORT
    #define GELF_LOG_DEFAULT_PORT 12201
#endif

#ifndef GELF_LOG_DEFAULT_HOST
    #define GELF_LOG_DEFAULT_HOST "127.0.0.1"
#endif

// ===== cacheline 大小 =====
#ifndef GELF_LOG_CACHELINE_SIZE
    #define GELF_LOG_CACHELINE_SIZE 64
#endif

static_assert(GELF_LOG_MAX_PAYLOAD_SIZE > 0, "chunk payload must be positive");
static_assert((GELF_LOG_MAX_SIZE + GELF_LOG_MAX_PAYLOAD_SIZE - 1) / GELF_LOG_MAX_PAYLOAD_SIZE <= 128,
              "GELF allows at most 128 chunks per message");
