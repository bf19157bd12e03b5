#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <system_error>
#include <vector>

namespace fragcast {

constexpr uint32_t kMagic = 0x46524743; // 'FRGC'
constexpr uint8_t  kVersion = 1;

// Bytes subtracted from the datagram length when sizing a fragment payload.
constexpr size_t kDefaultProtocolOverhead = 32;
constexpr size_t kMaxPieces = 0xFFFF;

using MessageId = uint64_t;

// 1-based; total == 1 means the chunk carries a whole message.
struct PiecePosition {
    uint16_t index{1};
    uint16_t total{1};
};

inline bool operator==(const PiecePosition& a, const PiecePosition& b) {
    return a.index == b.index && a.total == b.total;
}
inline bool operator!=(const PiecePosition& a, const PiecePosition& b) { return !(a == b); }

struct Chunk {
    MessageId id{0};
    PiecePosition piece;
    std::vector<uint8_t> payload;
};

struct CompleteMessage {
    MessageId id{0};
    std::vector<uint8_t> payload;
};

inline bool operator==(const CompleteMessage& a, const CompleteMessage& b) {
    return a.id == b.id && a.payload == b.payload;
}
inline bool operator!=(const CompleteMessage& a, const CompleteMessage& b) { return !(a == b); }

#pragma pack(push, 1)
struct ChunkHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  flags;
    uint16_t piece_index;
    uint16_t piece_total;
    uint16_t reserved;
    uint64_t message_id;
    uint32_t payload_len;
    uint32_t header_crc32;
};
#pragma pack(pop)
static_assert(sizeof(ChunkHeader) == 28, "ChunkHeader must be 28 bytes");
static_assert(kDefaultProtocolOverhead >= sizeof(ChunkHeader),
              "protocol overhead must cover the chunk header");

uint32_t crc32(const uint8_t* data, size_t len);

// Serializes one chunk into `out`. Fails with errc::record_too_large when the
// encoded record would not fit in `size_bound` bytes.
bool encode_chunk(const Chunk& chunk, size_t size_bound,
                  std::vector<uint8_t>& out, std::error_code& ec);

// Parses one datagram. Anything that is not a well-formed chunk yields
// errc::malformed_datagram.
std::optional<Chunk> decode_chunk(const uint8_t* data, size_t len, std::error_code& ec);

} // namespace fragcast
