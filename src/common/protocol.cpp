#include "protocol.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <array>
#include <cstring>

namespace fragcast {

namespace {

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

uint32_t header_checksum(const ChunkHeader &h) {
  return crc32(reinterpret_cast<const uint8_t *>(&h),
               sizeof(h) - sizeof(h.header_crc32));
}

std::optional<Chunk> malformed(std::error_code &ec, const char *why) {
  Logger::instance().log(LogLevel::DEBUG, "malformed datagram: %s", why);
  ec = make_error_code(errc::malformed_datagram);
  return std::nullopt;
}

} // namespace

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_crc_table();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

bool encode_chunk(const Chunk &chunk, size_t size_bound,
                  std::vector<uint8_t> &out, std::error_code &ec) {
  ec.clear();
  size_t need = sizeof(ChunkHeader) + chunk.payload.size();
  if (need > size_bound) {
    ec = make_error_code(errc::record_too_large);
    return false;
  }

  ChunkHeader h{};
  h.magic = kMagic;
  h.version = kVersion;
  h.flags = 0;
  h.piece_index = chunk.piece.index;
  h.piece_total = chunk.piece.total;
  h.reserved = 0;
  h.message_id = chunk.id;
  h.payload_len = (uint32_t)chunk.payload.size();
  h.header_crc32 = header_checksum(h);

  out.resize(need);
  std::memcpy(out.data(), &h, sizeof(ChunkHeader));
  if (!chunk.payload.empty())
    std::memcpy(out.data() + sizeof(ChunkHeader), chunk.payload.data(),
                chunk.payload.size());
  return true;
}

std::optional<Chunk> decode_chunk(const uint8_t *data, size_t len,
                                  std::error_code &ec) {
  ec.clear();
  if (len < sizeof(ChunkHeader))
    return malformed(ec, "short datagram");

  ChunkHeader h;
  std::memcpy(&h, data, sizeof(h));
  if (h.magic != kMagic || h.version != kVersion)
    return malformed(ec, "bad magic or version");
  if (h.header_crc32 != header_checksum(h))
    return malformed(ec, "header crc mismatch");
  if (h.payload_len != len - sizeof(ChunkHeader))
    return malformed(ec, "payload length mismatch");
  if (h.piece_total == 0 || h.piece_index == 0 ||
      h.piece_index > h.piece_total)
    return malformed(ec, "piece position out of range");

  Chunk c;
  c.id = h.message_id;
  c.piece.index = h.piece_index;
  c.piece.total = h.piece_total;
  c.payload.assign(data + sizeof(ChunkHeader), data + len);
  return c;
}

} // namespace fragcast
