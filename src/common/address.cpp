#include "address.hpp"
#include "logging.hpp"

namespace fragcast {

AddressSet AddressSet::resolve(const udp::resolver::executor_type &ex,
                               const std::string &host, uint16_t port,
                               std::error_code &ec) {
  ec.clear();
  udp::resolver res(ex);
  auto results = res.resolve(host, std::to_string(port), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "resolve %s:%u failed: %s",
                           host.c_str(), (unsigned)port, ec.message().c_str());
    return AddressSet();
  }
  std::vector<udp::endpoint> eps;
  for (const auto &r : results)
    eps.push_back(r.endpoint());
  if (eps.empty())
    ec = asio::error::host_not_found;
  return AddressSet(std::move(eps));
}

AddressSet AddressSet::resolve(const udp::resolver::executor_type &ex,
                               const std::string &host, uint16_t port) {
  std::error_code ec;
  AddressSet out = resolve(ex, host, port, ec);
  if (ec)
    throw std::system_error(ec, "resolve " + host);
  return out;
}

std::string endpoint_to_string(const udp::endpoint &ep) {
  auto addr = ep.address();
  if (addr.is_v6())
    return "[" + addr.to_string() + "]:" + std::to_string(ep.port());
  return addr.to_string() + ":" + std::to_string(ep.port());
}

} // namespace fragcast
