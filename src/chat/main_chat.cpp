#include "logging.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace fragcast;

static void usage() {
  std::cerr << "usage: fragcast_chat --listen host:port --peer host:port\n"
               "       [--datagram N] [--overhead N] [--replication N]\n"
               "       [--block host:port]... [--log-level L]\n";
}

int main(int argc, char **argv) {
  std::string listen = "127.0.0.1:47000";
  std::string peer;
  size_t datagram = 1400, overhead = kDefaultProtocolOverhead;
  uint16_t replication = 1;
  std::vector<std::string> blocked;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    try {
      if (a == "--listen")
        listen = next(i);
      else if (a == "--peer")
        peer = next(i);
      else if (a == "--datagram")
        datagram = (size_t)std::stoul(next(i));
      else if (a == "--overhead")
        overhead = (size_t)std::stoul(next(i));
      else if (a == "--replication")
        replication = (uint16_t)std::stoul(next(i));
      else if (a == "--block")
        blocked.push_back(next(i));
      else if (a == "--log-level") {
        LogLevel lvl;
        if (!parse_log_level(next(i), lvl)) {
          std::cerr << "bad log level" << std::endl;
          return 1;
        }
        Logger::instance().set_level(lvl);
      } else {
        usage();
        return 1;
      }
    } catch (const std::exception &) {
      std::cerr << "bad value for " << a << std::endl;
      return 1;
    }
  }

  std::string host, phost;
  uint16_t port, pport;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (peer.empty() || !parse_host_port(peer, phost, pport)) {
    usage();
    return 1;
  }

  asio::io_context io;
  SenderConfig scfg;
  scfg.datagram_length = datagram;
  scfg.protocol_overhead = overhead;
  scfg.replication = replication;
  ReceiverConfig rcfg;
  rcfg.datagram_length = datagram;

  std::unique_ptr<Sender> sender;
  std::unique_ptr<Receiver> receiver;
  try {
    for (const auto &b : blocked) {
      std::string bh;
      uint16_t bp;
      if (!parse_host_port(b, bh, bp)) {
        std::cerr << "bad block address " << b << std::endl;
        return 1;
      }
      for (const auto &ep : AddressSet::resolve(io.get_executor(), bh, bp))
        rcfg.filter.add(ep);
    }
    auto in = bind_udp(io, host, port);
    auto out = duplicate_socket(io, in);
    sender.reset(new Sender(std::move(out), scfg));
    receiver.reset(new Receiver(std::move(in), rcfg));
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "setup failed: %s", e.what());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "listening on %s, peer %s",
                         listen.c_str(), peer.c_str());

  std::thread tx([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      std::vector<uint8_t> msg(line.begin(), line.end());
      std::error_code ec;
      sender->enqueue(msg, phost, pport, ec);
      if (!ec)
        sender->send_all(ec);
      if (ec)
        Logger::instance().log(LogLevel::WARN, "send failed: %s",
                               ec.message().c_str());
    }
    Logger::instance().log(LogLevel::INFO, "stdin closed");
  });

  std::thread rx([&]() {
    for (;;) {
      std::error_code ec;
      auto d = receiver->poll(ec);
      if (ec) {
        if (ec == asio::error::bad_descriptor ||
            ec == asio::error::operation_aborted)
          return;
        Logger::instance().log(LogLevel::WARN, "poll error: %s",
                               ec.message().c_str());
        continue;
      }
      std::string text(d->message.payload.begin(), d->message.payload.end());
      std::cout << "[" << endpoint_to_string(d->from) << " #"
                << d->message.id << "] " << text << std::endl;
    }
  });

  tx.join();
  rx.join();
  return 0;
}
