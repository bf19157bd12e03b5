#include "util.hpp"
#include <stdexcept>

namespace fragcast {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos + 1 == s.size())
    return false;
  host = s.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  if (host.empty())
    return false;
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1 || p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace fragcast
