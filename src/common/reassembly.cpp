#include "reassembly.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace fragcast {

static bool valid_position(const PiecePosition &p) {
  return p.total != 0 && p.index != 0 && p.index <= p.total;
}

ReassemblyStage::ReassemblyStage(Chunk first)
    : id_(first.id), total_pieces_(first.piece.total) {
  if (!valid_position(first.piece))
    throw std::invalid_argument("reassembly stage seeded with invalid piece");
  pieces_.resize(total_pieces_);
  present_.assign(total_pieces_, false);
  add(std::move(first));
}

ReassemblyStage::AddResult ReassemblyStage::add(Chunk chunk) {
  if (chunk.id != id_ || chunk.piece.total != total_pieces_ ||
      !valid_position(chunk.piece))
    return AddResult::Rejected;
  size_t slot = chunk.piece.index - 1;
  if (present_[slot])
    return AddResult::Duplicate;
  pieces_[slot] = std::move(chunk.payload);
  present_[slot] = true;
  stored_++;
  return AddResult::Stored;
}

CompleteMessage ReassemblyStage::merge() {
  if (!is_ready())
    throw std::logic_error("merge of incomplete reassembly stage");
  size_t size = 0;
  for (const auto &p : pieces_)
    size += p.size();
  CompleteMessage out;
  out.id = id_;
  out.payload.reserve(size);
  for (auto &p : pieces_) {
    out.payload.insert(out.payload.end(), p.begin(), p.end());
    p.clear();
  }
  present_.assign(total_pieces_, false);
  stored_ = 0;
  return out;
}

MessageQueue::MessageQueue(size_t max_partial_messages)
    : max_partial_(max_partial_messages) {}

std::optional<CompleteMessage> MessageQueue::insert(Chunk chunk) {
  MessageId id = chunk.id;

  if (last_released_ && *last_released_ >= id) {
    Logger::instance().log(LogLevel::TRACE,
                           "drop stale chunk id=%llu (released %llu)",
                           (unsigned long long)id,
                           (unsigned long long)*last_released_);
    return std::nullopt;
  }
  if (!valid_position(chunk.piece)) {
    Logger::instance().log(LogLevel::DEBUG,
                           "drop chunk id=%llu with piece %u/%u",
                           (unsigned long long)id, (unsigned)chunk.piece.index,
                           (unsigned)chunk.piece.total);
    return std::nullopt;
  }

  if (chunk.piece.total == 1) {
    mark_released(id);
    return CompleteMessage{id, std::move(chunk.payload)};
  }

  auto it = stages_.find(id);
  if (it == stages_.end()) {
    if (!make_room_for(id))
      return std::nullopt;
    stages_.emplace(id, ReassemblyStage(std::move(chunk)));
    return std::nullopt;
  }

  auto res = it->second.add(std::move(chunk));
  if (res == ReassemblyStage::AddResult::Rejected) {
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk for id=%llu disagrees with its stage",
                           (unsigned long long)id);
    return std::nullopt;
  }
  if (!it->second.is_ready())
    return std::nullopt;

  CompleteMessage done = it->second.merge();
  stages_.erase(it);
  mark_released(id);
  return done;
}

void MessageQueue::mark_released(MessageId id) {
  last_released_ = id;
  auto end = stages_.lower_bound(id);
  for (auto it = stages_.begin(); it != end; ++it)
    Logger::instance().log(LogLevel::DEBUG,
                           "id=%llu superseded by id=%llu with %u/%u pieces",
                           (unsigned long long)it->first,
                           (unsigned long long)id,
                           (unsigned)it->second.stored_pieces(),
                           (unsigned)it->second.total_pieces());
  stages_.erase(stages_.begin(), end);
}

// The lowest id is the one the supersession policy values least, so it is
// the one to give up when the cap is reached.
bool MessageQueue::make_room_for(MessageId id) {
  if (max_partial_ == 0)
    return true;
  while (stages_.size() >= max_partial_) {
    auto oldest = stages_.begin();
    if (id < oldest->first) {
      Logger::instance().log(LogLevel::DEBUG,
                             "stage cap reached, drop new id=%llu",
                             (unsigned long long)id);
      return false;
    }
    Logger::instance().log(LogLevel::DEBUG,
                           "stage cap reached, evict id=%llu",
                           (unsigned long long)oldest->first);
    stages_.erase(oldest);
  }
  return true;
}

} // namespace fragcast
