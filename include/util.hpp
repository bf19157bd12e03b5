#pragma once
#include <string>
#include <cstdint>

namespace fragcast {

// Splits "host:port"; a bracketed IPv6 host ("[::1]:9000") loses its brackets.
bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

} // namespace fragcast
