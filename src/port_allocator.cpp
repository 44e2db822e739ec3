#include "port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace bridge {

std::optional<int> LoopbackPortAllocator::FindFreePort(std::string* err) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (err) *err = std::string("socket: ") + std::strerror(errno);
    return std::nullopt;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (err) *err = std::string("bind: ") + std::strerror(errno);
    ::close(fd);
    return std::nullopt;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    if (err) *err = std::string("getsockname: ") + std::strerror(errno);
    ::close(fd);
    return std::nullopt;
  }
  ::close(fd);
  return static_cast<int>(ntohs(addr.sin_port));
}

std::optional<int> FixedPortAllocator::FindFreePort(std::string* err) {
  if (port_ <= 0 || port_ > 65535) {
    if (err) *err = "invalid port " + std::to_string(port_);
    return std::nullopt;
  }
  return port_;
}

}  // namespace bridge
