#include "transport.hpp"
#include "logging.hpp"
#include <cerrno>
#include <unistd.h>

namespace fragcast {

using udp = asio::ip::udp;

udp::socket bind_udp(asio::io_context &io, const std::string &host,
                     uint16_t port, std::error_code &ec) {
  udp::socket sock(io);
  auto addr = asio::ip::make_address(host, ec);
  if (ec)
    return sock;
  udp::endpoint ep(addr, port);
  sock.open(ep.protocol(), ec);
  if (ec)
    return sock;
  sock.bind(ep, ec);
  if (ec) {
    std::error_code ec2;
    sock.close(ec2);
    return sock;
  }
  std::error_code ec2;
  Logger::instance().log(LogLevel::DEBUG, "bound udp %s:%u", host.c_str(),
                         (unsigned)sock.local_endpoint(ec2).port());
  return sock;
}

udp::socket bind_udp(asio::io_context &io, const std::string &host,
                     uint16_t port) {
  std::error_code ec;
  udp::socket sock = bind_udp(io, host, port, ec);
  if (ec)
    throw std::system_error(ec, "bind " + host + ":" + std::to_string(port));
  return sock;
}

udp::socket duplicate_socket(asio::io_context &io, udp::socket &sock,
                             std::error_code &ec) {
  udp::socket out(io);
  auto local = sock.local_endpoint(ec);
  if (ec)
    return out;
  int fd = ::dup(sock.native_handle());
  if (fd < 0) {
    ec.assign(errno, std::system_category());
    return out;
  }
  out.assign(local.protocol(), fd, ec);
  if (ec)
    ::close(fd);
  return out;
}

udp::socket duplicate_socket(asio::io_context &io, udp::socket &sock) {
  std::error_code ec;
  udp::socket out = duplicate_socket(io, sock, ec);
  if (ec)
    throw std::system_error(ec, "duplicate socket");
  return out;
}

} // namespace fragcast
