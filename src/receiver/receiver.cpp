#include "receiver.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace fragcast {

Receiver::Receiver(udp::socket socket, const ReceiverConfig &cfg)
    : socket_(std::move(socket)), cfg_(cfg) {
  if (cfg_.datagram_length < sizeof(ChunkHeader))
    throw std::invalid_argument("datagram length smaller than chunk header");
  recv_buf_.resize(cfg_.datagram_length);
}

std::optional<Delivery> Receiver::poll(std::error_code &ec) {
  ec.clear();
  for (;;) {
    udp::endpoint from;
    size_t n = socket_.receive_from(asio::buffer(recv_buf_), from, 0, ec);
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "receive failed: %s",
                             ec.message().c_str());
      return std::nullopt;
    }

    if (!cfg_.filter.allows(from)) {
      Logger::instance().log(LogLevel::TRACE, "filtered datagram from %s",
                             endpoint_to_string(from).c_str());
      continue;
    }

    auto chunk = decode_chunk(recv_buf_.data(), n, ec);
    if (!chunk) {
      Logger::instance().log(LogLevel::DEBUG, "bad datagram from %s: %s",
                             endpoint_to_string(from).c_str(),
                             ec.message().c_str());
      return std::nullopt;
    }

    Peer &peer = peer_for(from);
    auto done = peer.queue.insert(std::move(*chunk));
    if (done) {
      Logger::instance().log(LogLevel::TRACE,
                             "message id=%llu (%zu bytes) from %s",
                             (unsigned long long)done->id,
                             done->payload.size(),
                             endpoint_to_string(from).c_str());
      return Delivery{from, std::move(*done)};
    }
  }
}

Delivery Receiver::poll() {
  std::error_code ec;
  auto d = poll(ec);
  if (ec)
    throw std::system_error(ec, "poll");
  return std::move(*d);
}

void Receiver::clear(const udp::endpoint &peer) {
  if (peers_.erase(peer))
    Logger::instance().log(LogLevel::DEBUG, "cleared peer %s",
                           endpoint_to_string(peer).c_str());
}

const MessageQueue *Receiver::peer_queue(const udp::endpoint &peer) const {
  auto it = peers_.find(peer);
  return it == peers_.end() ? nullptr : &it->second.queue;
}

Receiver::Peer &Receiver::peer_for(const udp::endpoint &from) {
  auto it = peers_.find(from);
  if (it == peers_.end()) {
    if (cfg_.max_peers != 0 && peers_.size() >= cfg_.max_peers) {
      auto lru = peers_.begin();
      for (auto p = peers_.begin(); p != peers_.end(); ++p)
        if (p->second.last_active < lru->second.last_active)
          lru = p;
      Logger::instance().log(LogLevel::DEBUG,
                             "peer cap reached, evict %s",
                             endpoint_to_string(lru->first).c_str());
      peers_.erase(lru);
    }
    it = peers_.emplace(from, Peer{MessageQueue(cfg_.max_partial_messages), 0})
             .first;
    Logger::instance().log(LogLevel::DEBUG, "new peer %s",
                           endpoint_to_string(from).c_str());
  }
  it->second.last_active = ++activity_;
  return it->second;
}

} // namespace fragcast
