#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "address.hpp"
#include "protocol.hpp"

namespace fragcast {

struct SenderConfig {
    size_t datagram_length{1400};
    size_t protocol_overhead{kDefaultProtocolOverhead};
    uint16_t replication{1};
};

// Splits `message` into consecutive pieces of at most `capacity` bytes, all
// tagged with `id`. An empty message still produces one (1,1) piece.
std::vector<Chunk> split_message(MessageId id, const std::vector<uint8_t>& message,
                                 size_t capacity, std::error_code& ec);

class Sender {
public:
    using udp = asio::ip::udp;

    // Throws std::invalid_argument on an unusable config.
    Sender(udp::socket socket, const SenderConfig& cfg);

    // Queues every chunk of `message`, `replication` times, for `dest`.
    void enqueue(const std::vector<uint8_t>& message, const AddressSet& dest, std::error_code& ec);
    void enqueue(const std::vector<uint8_t>& message, const AddressSet& dest);
    void enqueue(const std::vector<uint8_t>& message, const std::string& host, uint16_t port,
                 std::error_code& ec);
    void enqueue(const std::vector<uint8_t>& message, const std::string& host, uint16_t port);

    // Sends the oldest queued chunk. Returns true while more remain.
    bool send_one(std::error_code& ec);
    bool send_one();
    void send_all(std::error_code& ec);
    void send_all();

    size_t queue_len() const { return out_q_.size(); }
    bool is_queue_empty() const { return out_q_.empty(); }
    MessageId last_id() const { return last_id_; }
    size_t fragment_capacity() const { return cfg_.datagram_length - cfg_.protocol_overhead; }
    const SenderConfig& config() const { return cfg_; }
    udp::socket& socket() { return socket_; }

private:
    struct Outbound {
        Chunk chunk;
        std::shared_ptr<const AddressSet> dest;
    };

    udp::socket socket_;
    SenderConfig cfg_;
    std::deque<Outbound> out_q_;
    MessageId last_id_{0};
    std::vector<uint8_t> wire_buf_;
};

} // namespace fragcast
