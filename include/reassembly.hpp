#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>
#include "protocol.hpp"

namespace fragcast {

// Accumulates the pieces of one message id. Slots are addressed by piece
// index, sized from the total carried by the first chunk.
class ReassemblyStage {
public:
    enum class AddResult { Stored, Duplicate, Rejected };

    // Throws std::invalid_argument if `first` has an invalid piece position.
    explicit ReassemblyStage(Chunk first);

    AddResult add(Chunk chunk);
    bool is_ready() const { return stored_ == total_pieces_; }

    // Concatenates the pieces in index order. The stage is left empty.
    // Throws std::logic_error when called before is_ready().
    CompleteMessage merge();

    MessageId id() const { return id_; }
    uint16_t total_pieces() const { return total_pieces_; }
    uint16_t stored_pieces() const { return stored_; }

private:
    MessageId id_;
    uint16_t total_pieces_;
    uint16_t stored_{0};
    std::vector<std::vector<uint8_t>> pieces_;
    std::vector<bool> present_;
};

// Per-peer supersession state: releases a message as soon as it is complete
// and drops every older partial message at that moment.
class MessageQueue {
public:
    // max_partial_messages == 0 leaves the number of open stages unbounded.
    explicit MessageQueue(size_t max_partial_messages = 0);

    std::optional<CompleteMessage> insert(Chunk chunk);

    std::optional<MessageId> last_released() const { return last_released_; }
    size_t open_stages() const { return stages_.size(); }
    bool has_stage(MessageId id) const { return stages_.count(id) != 0; }

private:
    void mark_released(MessageId id);
    bool make_room_for(MessageId id);

    size_t max_partial_;
    std::optional<MessageId> last_released_;
    std::map<MessageId, ReassemblyStage> stages_;
};

} // namespace fragcast
