#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "../config.hpp"

namespace gelf_logger
{

class IDatagramTransport
{
 public:
  virtual ~IDatagramTransport() = default;

  // 发送一个完整的数据报；失败时抛出 TransportError
  virtual void Send(std::string_view datagram) = 0;
};

// Connected UDP socket towards the collector. The socket is opened in the
// constructor and closed in the destructor.
class UdpTransport : public IDatagramTransport
{
 public:
  // Resolves `host` (numeric or DNS name). Throws TransportError.
  UdpTransport(const std::string& host, uint16_t port);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  void Send(std::string_view datagram) override;

  bool IsOpen() const { return fd_ >= 0; }

 private:
  std::string host_;
  uint16_t port_;
  int fd_;

  void Open();
  void Close();
};

using TransportFactory = std::function<std::unique_ptr<IDatagramTransport>(const Config&)>;

// Opens a UdpTransport to config.collector_host:collector_port.
TransportFactory udp_transport_factory();

}  // namespace gelf_logger
