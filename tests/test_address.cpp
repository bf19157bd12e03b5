#include "address.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <gtest/gtest.h>

using namespace fragcast;

namespace {

udp::endpoint ep(const char *addr, uint16_t port) {
  return udp::endpoint(asio::ip::make_address(addr), port);
}

} // namespace

TEST(AddressFilter, EmptyBlacklistAdmitsEveryone) {
  auto f = AddressFilter::empty_blacklist();
  EXPECT_EQ(f.mode(), AddressFilter::Mode::Blacklist);
  EXPECT_TRUE(f.allows(ep("127.0.0.1", 1)));
  EXPECT_TRUE(f.allows(ep("::1", 65535)));
}

TEST(AddressFilter, BlacklistRejectsMembersOnly) {
  auto f = AddressFilter::blacklist({ep("10.0.0.1", 9000)});
  EXPECT_FALSE(f.allows(ep("10.0.0.1", 9000)));
  EXPECT_TRUE(f.allows(ep("10.0.0.1", 9001)));
  EXPECT_TRUE(f.allows(ep("10.0.0.2", 9000)));
}

TEST(AddressFilter, WhitelistAdmitsMembersOnly) {
  auto f = AddressFilter::whitelist({ep("10.0.0.1", 9000)});
  EXPECT_TRUE(f.allows(ep("10.0.0.1", 9000)));
  EXPECT_FALSE(f.allows(ep("10.0.0.1", 9001)));

  f.add(ep("10.0.0.3", 1));
  EXPECT_TRUE(f.allows(ep("10.0.0.3", 1)));
  f.remove(ep("10.0.0.1", 9000));
  EXPECT_FALSE(f.allows(ep("10.0.0.1", 9000)));
  EXPECT_EQ(f.members().size(), 1u);
}

TEST(AddressSet, ResolvesNumericHost) {
  asio::io_context io;
  auto set = AddressSet::resolve(io.get_executor(), "127.0.0.1", 4242);
  ASSERT_EQ(set.size(), 1u);
  EXPECT_EQ(*set.begin(), ep("127.0.0.1", 4242));
}

TEST(AddressSet, ResolveFailureIsReported) {
  asio::io_context io;
  std::error_code ec;
  auto set = AddressSet::resolve(io.get_executor(), "no-such-host.invalid", 1, ec);
  EXPECT_TRUE(ec);
  EXPECT_TRUE(set.empty());
}

TEST(AddressSet, KeepsEveryEndpoint) {
  AddressSet set(std::vector<udp::endpoint>{ep("127.0.0.1", 1), ep("127.0.0.1", 2)});
  EXPECT_EQ(set.size(), 2u);
  EXPECT_EQ(set.endpoints()[1].port(), 2);
}

TEST(Util, EndpointToString) {
  EXPECT_EQ(endpoint_to_string(ep("127.0.0.1", 80)), "127.0.0.1:80");
  EXPECT_EQ(endpoint_to_string(ep("::1", 80)), "[::1]:80");
}

TEST(Util, ParseHostPort) {
  std::string host;
  uint16_t port = 0;
  ASSERT_TRUE(parse_host_port("127.0.0.1:9000", host, port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 9000);
  ASSERT_TRUE(parse_host_port("[::1]:53", host, port));
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 53);
  EXPECT_FALSE(parse_host_port("localhost", host, port));
  EXPECT_FALSE(parse_host_port("localhost:", host, port));
  EXPECT_FALSE(parse_host_port("localhost:70000", host, port));
  EXPECT_FALSE(parse_host_port("localhost:12ab", host, port));
  EXPECT_FALSE(parse_host_port(":80", host, port));
}

TEST(Util, ParseLogLevel) {
  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("DEBUG", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  EXPECT_TRUE(parse_log_level("warn", lvl));
  EXPECT_EQ(lvl, LogLevel::WARN);
  EXPECT_FALSE(parse_log_level("loud", lvl));
  EXPECT_EQ(lvl, LogLevel::WARN);
}
