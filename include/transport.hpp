#pragma once
#include <asio.hpp>
#include <string>
#include <system_error>

namespace fragcast {

// Opens a UDP socket bound to host:port. The address family follows host.
asio::ip::udp::socket bind_udp(asio::io_context& io, const std::string& host,
                               uint16_t port, std::error_code& ec);
asio::ip::udp::socket bind_udp(asio::io_context& io, const std::string& host, uint16_t port);

// Returns a second handle to the same OS socket, so a Sender and a Receiver
// can each own one and run on separate threads.
asio::ip::udp::socket duplicate_socket(asio::io_context& io,
                                       asio::ip::udp::socket& sock,
                                       std::error_code& ec);
asio::ip::udp::socket duplicate_socket(asio::io_context& io, asio::ip::udp::socket& sock);

} // namespace fragcast
