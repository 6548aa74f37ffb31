#pragma once
#include <stdexcept>
#include <string>

namespace gelf_logger
{

class GelfError : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

// The encoder could not represent the document. Fatal for that one event.
class EncodeError : public GelfError
{
 public:
  using GelfError::GelfError;
};

class CompressionError : public GelfError
{
 public:
  using GelfError::GelfError;
};

// Only raised under OversizePolicy::Fail.
class MessageTooLargeError : public GelfError
{
 public:
  MessageTooLargeError(size_t size, size_t limit)
      : GelfError("message too large: " + std::to_string(size) + " bytes exceeds " +
                  std::to_string(limit)),
        size_(size)
  {
  }

  size_t Size() const { return size_; }

 private:
  size_t size_;
};

// Socket resolve/open/send failure. Fatal for the owning worker.
class TransportError : public GelfError
{
 public:
  using GelfError::GelfError;
};

class ConfigError : public GelfError
{
 public:
  using GelfError::GelfError;
};

}  // namespace gelf_logger
