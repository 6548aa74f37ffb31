#include "gelf_logger/transport/udp_transport.hpp"
#include "gelf_logger/errors.hpp"
#include "gelf_logger/platform.hpp"

#include <fmt/format.h>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace gelf_logger {

UdpTransport::UdpTransport(const std::string& host, uint16_t port)
    : host_(host)
    , port_(port)
    , fd_(-1)
{
    Open();
}

UdpTransport::~UdpTransport() {
    Close();
}

void UdpTransport::Open() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port_);
    int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw TransportError(fmt::format("cannot resolve '{}': {}", host_, ::gai_strerror(rc)));
    }

    int last_errno = 0;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
#if defined(GELF_LOG_PLATFORM_LINUX)
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
#else
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd >= 0) {
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
#endif
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_errno = errno;
            ::close(fd);
            continue;
        }
        fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        throw TransportError(fmt::format("cannot open UDP socket to {}:{}: {}",
                                         host_, port_, std::strerror(last_errno)));
    }
}

void UdpTransport::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void UdpTransport::Send(std::string_view datagram) {
    if (fd_ < 0) {
        throw TransportError("UDP socket is closed");
    }
    ssize_t sent = ::send(fd_, datagram.data(), datagram.size(), 0);
    if (sent < 0) {
        int err = errno;
        // an ICMP port unreachable from a previous datagram surfaces here
        if (err == ECONNREFUSED) {
            return;
        }
        throw TransportError(fmt::format("send to {}:{} failed: {}", host_, port_,
                                         std::strerror(err)));
    }
}

TransportFactory udp_transport_factory() {
    return [](const Config& config) -> std::unique_ptr<IDatagramTransport> {
        return std::make_unique<UdpTransport>(config.collector_host, config.collector_port);
    };
}

} // namespace gelf_logger
