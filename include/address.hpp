#pragma once
#include <asio.hpp>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fragcast {

using udp = asio::ip::udp;

// One logical destination: every endpoint a message is sent to.
class AddressSet {
public:
    using const_iterator = std::vector<udp::endpoint>::const_iterator;

    AddressSet() = default;
    explicit AddressSet(udp::endpoint ep) : endpoints_{ep} {}
    explicit AddressSet(std::vector<udp::endpoint> eps) : endpoints_(std::move(eps)) {}

    // Resolves host/port through the system resolver; every result is kept.
    static AddressSet resolve(const udp::resolver::executor_type& ex, const std::string& host,
                              uint16_t port, std::error_code& ec);
    static AddressSet resolve(const udp::resolver::executor_type& ex, const std::string& host,
                              uint16_t port);

    const std::vector<udp::endpoint>& endpoints() const { return endpoints_; }
    bool empty() const { return endpoints_.empty(); }
    size_t size() const { return endpoints_.size(); }
    const_iterator begin() const { return endpoints_.begin(); }
    const_iterator end() const { return endpoints_.end(); }

private:
    std::vector<udp::endpoint> endpoints_;
};

// Source admission check, applied to every datagram before it is decoded.
class AddressFilter {
public:
    enum class Mode { Whitelist, Blacklist };

    AddressFilter(Mode mode, std::set<udp::endpoint> members)
        : mode_(mode), members_(std::move(members)) {}

    static AddressFilter whitelist(std::set<udp::endpoint> members) {
        return AddressFilter(Mode::Whitelist, std::move(members));
    }
    static AddressFilter blacklist(std::set<udp::endpoint> members) {
        return AddressFilter(Mode::Blacklist, std::move(members));
    }
    static AddressFilter empty_blacklist() { return blacklist({}); }

    bool allows(const udp::endpoint& ep) const {
        bool listed = members_.count(ep) != 0;
        return mode_ == Mode::Whitelist ? listed : !listed;
    }

    void add(const udp::endpoint& ep) { members_.insert(ep); }
    void remove(const udp::endpoint& ep) { members_.erase(ep); }

    Mode mode() const { return mode_; }
    const std::set<udp::endpoint>& members() const { return members_; }

private:
    Mode mode_;
    std::set<udp::endpoint> members_;
};

std::string endpoint_to_string(const udp::endpoint& ep);

} // namespace fragcast
