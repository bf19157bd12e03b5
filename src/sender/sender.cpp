#include "sender.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace fragcast {

std::vector<Chunk> split_message(MessageId id,
                                 const std::vector<uint8_t> &message,
                                 size_t capacity, std::error_code &ec) {
  ec.clear();
  std::vector<Chunk> out;
  if (capacity == 0) {
    ec = make_error_code(errc::record_too_large);
    return out;
  }
  size_t count = (message.size() + capacity - 1) / capacity;
  if (count == 0)
    count = 1;
  if (count > kMaxPieces) {
    ec = make_error_code(errc::message_too_large);
    return out;
  }

  out.reserve(count);
  size_t offset = 0;
  for (size_t i = 0; i < count; i++) {
    size_t n = std::min(capacity, message.size() - offset);
    Chunk c;
    c.id = id;
    c.piece.index = (uint16_t)(i + 1);
    c.piece.total = (uint16_t)count;
    c.payload.assign(message.begin() + offset, message.begin() + offset + n);
    offset += n;
    out.push_back(std::move(c));
  }
  return out;
}

Sender::Sender(udp::socket socket, const SenderConfig &cfg)
    : socket_(std::move(socket)), cfg_(cfg) {
  if (cfg_.protocol_overhead < sizeof(ChunkHeader))
    throw std::invalid_argument("protocol overhead smaller than chunk header");
  if (cfg_.datagram_length <= cfg_.protocol_overhead)
    throw std::invalid_argument("datagram length must exceed protocol overhead");
  if (cfg_.replication == 0)
    throw std::invalid_argument("replication must be at least 1");
  wire_buf_.reserve(cfg_.datagram_length);
}

void Sender::enqueue(const std::vector<uint8_t> &message,
                     const AddressSet &dest, std::error_code &ec) {
  ec.clear();
  MessageId id = last_id_ + 1;
  std::vector<Chunk> pieces =
      split_message(id, message, fragment_capacity(), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN,
                           "refusing %zu byte message: %s", message.size(),
                           ec.message().c_str());
    return;
  }
  last_id_ = id;

  auto shared_dest = std::make_shared<const AddressSet>(dest);
  for (uint16_t copy = 0; copy < cfg_.replication; ++copy) {
    for (const Chunk &c : pieces)
      out_q_.push_back(Outbound{c, shared_dest});
  }
  Logger::instance().log(LogLevel::TRACE,
                         "queued id=%llu pieces=%zu copies=%u endpoints=%zu",
                         (unsigned long long)id, pieces.size(),
                         (unsigned)cfg_.replication, dest.size());
}

void Sender::enqueue(const std::vector<uint8_t> &message,
                     const AddressSet &dest) {
  std::error_code ec;
  enqueue(message, dest, ec);
  if (ec)
    throw std::system_error(ec, "enqueue");
}

void Sender::enqueue(const std::vector<uint8_t> &message,
                     const std::string &host, uint16_t port,
                     std::error_code &ec) {
  AddressSet dest = AddressSet::resolve(socket_.get_executor(), host, port, ec);
  if (ec)
    return;
  enqueue(message, dest, ec);
}

void Sender::enqueue(const std::vector<uint8_t> &message,
                     const std::string &host, uint16_t port) {
  std::error_code ec;
  enqueue(message, host, port, ec);
  if (ec)
    throw std::system_error(ec, "enqueue " + host);
}

bool Sender::send_one(std::error_code &ec) {
  ec.clear();
  if (out_q_.empty())
    return false;
  Outbound next = std::move(out_q_.front());
  out_q_.pop_front();

  if (!encode_chunk(next.chunk, cfg_.datagram_length, wire_buf_, ec)) {
    Logger::instance().log(LogLevel::WARN, "encode id=%llu piece %u/%u: %s",
                           (unsigned long long)next.chunk.id,
                           (unsigned)next.chunk.piece.index,
                           (unsigned)next.chunk.piece.total,
                           ec.message().c_str());
    return !out_q_.empty();
  }
  for (const auto &ep : *next.dest) {
    socket_.send_to(asio::buffer(wire_buf_), ep, 0, ec);
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "send to %s failed: %s",
                             endpoint_to_string(ep).c_str(),
                             ec.message().c_str());
      return !out_q_.empty();
    }
  }
  return !out_q_.empty();
}

bool Sender::send_one() {
  std::error_code ec;
  bool more = send_one(ec);
  if (ec)
    throw std::system_error(ec, "send_one");
  return more;
}

void Sender::send_all(std::error_code &ec) {
  while (send_one(ec)) {
    if (ec)
      return;
  }
}

void Sender::send_all() {
  std::error_code ec;
  send_all(ec);
  if (ec)
    throw std::system_error(ec, "send_all");
}

} // namespace fragcast
