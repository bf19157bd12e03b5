#pragma once
#include <asio.hpp>
#include <map>
#include <optional>
#include <vector>
#include "address.hpp"
#include "protocol.hpp"
#include "reassembly.hpp"

namespace fragcast {

struct ReceiverConfig {
    size_t datagram_length{1400};
    size_t max_peers{0};            // 0: unbounded
    size_t max_partial_messages{0}; // per peer, 0: unbounded
    AddressFilter filter{AddressFilter::empty_blacklist()};
};

struct Delivery {
    asio::ip::udp::endpoint from;
    CompleteMessage message;
};

class Receiver {
public:
    using udp = asio::ip::udp;

    // Throws std::invalid_argument when datagram_length cannot hold a header.
    Receiver(udp::socket socket, const ReceiverConfig& cfg);

    // Blocks until one message completes. Transport and decode failures end
    // the call with `ec` set; filtered and stale datagrams do not.
    std::optional<Delivery> poll(std::error_code& ec);
    Delivery poll();

    // Forgets everything about one peer, including its last released id.
    void clear(const udp::endpoint& peer);

    size_t peer_count() const { return peers_.size(); }
    const MessageQueue* peer_queue(const udp::endpoint& peer) const;

    AddressFilter& filter() { return cfg_.filter; }
    const AddressFilter& filter() const { return cfg_.filter; }
    const ReceiverConfig& config() const { return cfg_; }
    udp::socket& socket() { return socket_; }

private:
    struct Peer {
        MessageQueue queue;
        uint64_t last_active{0};
    };

    Peer& peer_for(const udp::endpoint& from);

    udp::socket socket_;
    ReceiverConfig cfg_;
    std::vector<uint8_t> recv_buf_;
    std::map<udp::endpoint, Peer> peers_;
    uint64_t activity_{0};
};

} // namespace fragcast
