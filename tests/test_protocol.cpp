#include "errors.hpp"
#include "protocol.hpp"
#include <gtest/gtest.h>
#include <cstddef>
#include <cstring>

using namespace fragcast;

namespace {

std::vector<uint8_t> encoded(MessageId id, uint16_t index, uint16_t total,
                             std::vector<uint8_t> payload) {
  Chunk c{id, PiecePosition{index, total}, std::move(payload)};
  std::vector<uint8_t> out;
  std::error_code ec;
  EXPECT_TRUE(encode_chunk(c, 1500, out, ec));
  EXPECT_FALSE(ec);
  return out;
}

// Rewrites a header field and refreshes the crc so only the field is wrong.
void patch_header(std::vector<uint8_t> &wire, void (*edit)(ChunkHeader &)) {
  ChunkHeader h;
  std::memcpy(&h, wire.data(), sizeof(h));
  edit(h);
  h.header_crc32 = crc32(reinterpret_cast<const uint8_t *>(&h), sizeof(h) - 4);
  std::memcpy(wire.data(), &h, sizeof(h));
}

void expect_malformed(const std::vector<uint8_t> &wire) {
  std::error_code ec;
  auto c = decode_chunk(wire.data(), wire.size(), ec);
  EXPECT_FALSE(c.has_value());
  EXPECT_EQ(ec, errc::malformed_datagram);
}

} // namespace

TEST(Crc32, KnownVector) {
  const char *s = "123456789";
  EXPECT_EQ(crc32(reinterpret_cast<const uint8_t *>(s), 9), 0xCBF43926u);
}

TEST(ChunkCodec, RoundTrip) {
  auto wire = encoded(0x0102030405060708ull, 3, 7, {1, 2, 3, 4});
  EXPECT_EQ(wire.size(), sizeof(ChunkHeader) + 4);

  std::error_code ec;
  auto c = decode_chunk(wire.data(), wire.size(), ec);
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(ec);
  EXPECT_EQ(c->id, 0x0102030405060708ull);
  EXPECT_EQ(c->piece, (PiecePosition{3, 7}));
  EXPECT_EQ(c->payload, (std::vector<uint8_t>{1, 2, 3, 4}));
}

TEST(ChunkCodec, EmptyPayload) {
  auto wire = encoded(9, 1, 1, {});
  EXPECT_EQ(wire.size(), sizeof(ChunkHeader));
  std::error_code ec;
  auto c = decode_chunk(wire.data(), wire.size(), ec);
  ASSERT_TRUE(c.has_value());
  EXPECT_TRUE(c->payload.empty());
}

TEST(ChunkCodec, EncodeRespectsSizeBound) {
  Chunk c{1, PiecePosition{1, 1}, std::vector<uint8_t>(100, 0xAB)};
  std::vector<uint8_t> out;
  std::error_code ec;
  EXPECT_TRUE(encode_chunk(c, sizeof(ChunkHeader) + 100, out, ec));
  EXPECT_FALSE(encode_chunk(c, sizeof(ChunkHeader) + 99, out, ec));
  EXPECT_EQ(ec, errc::record_too_large);
  EXPECT_NE(ec, errc::malformed_datagram);
}

TEST(ChunkCodec, RejectsShortDatagram) {
  auto wire = encoded(1, 1, 1, {5});
  wire.resize(sizeof(ChunkHeader) - 1);
  expect_malformed(wire);
  expect_malformed({});
}

TEST(ChunkCodec, RejectsForeignMagicAndVersion) {
  auto wire = encoded(1, 1, 1, {5});
  patch_header(wire, [](ChunkHeader &h) { h.magic = 0x53435452; });
  expect_malformed(wire);

  wire = encoded(1, 1, 1, {5});
  patch_header(wire, [](ChunkHeader &h) { h.version = kVersion + 1; });
  expect_malformed(wire);
}

TEST(ChunkCodec, RejectsCorruptHeader) {
  auto wire = encoded(1, 1, 2, {5});
  wire[offsetof(ChunkHeader, message_id)] ^= 0x01;
  expect_malformed(wire);
}

TEST(ChunkCodec, RejectsLengthMismatch) {
  auto wire = encoded(1, 1, 1, {5, 6});
  wire.push_back(7);
  expect_malformed(wire);
  wire.resize(wire.size() - 2);
  expect_malformed(wire);
}

TEST(ChunkCodec, RejectsBadPiecePosition) {
  auto wire = encoded(1, 1, 2, {5});
  patch_header(wire, [](ChunkHeader &h) { h.piece_index = 0; });
  expect_malformed(wire);

  wire = encoded(1, 1, 2, {5});
  patch_header(wire, [](ChunkHeader &h) { h.piece_index = 3; });
  expect_malformed(wire);

  wire = encoded(1, 1, 2, {5});
  patch_header(wire, [](ChunkHeader &h) { h.piece_total = 0; });
  expect_malformed(wire);
}

TEST(Errors, CategoryMessages) {
  std::error_code ec = errc::malformed_datagram;
  EXPECT_STREQ(ec.category().name(), "fragcast");
  EXPECT_EQ(ec.message(), "malformed datagram");
  EXPECT_NE(std::error_code(errc::record_too_large).message(), ec.message());
}
