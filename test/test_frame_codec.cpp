#include "catch2/catch_test_macros.hpp"
#include "fake_transport.hpp"
#include "mrv_usb/frame.hpp"
#include <array>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <vector>

TEST_CASE("frames are encoded as little endian words in field order", "[Frame Codec]") {
  constexpr auto header = mrvlink::FrameHeader{0x0403'0201U, 0x0807'0605U, 0x0C0B'0A09U, 0x100F'0E0DU};
  constexpr auto bytes  = mrvlink::encode(header);

  STATIC_REQUIRE(bytes.size() == 16);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    CHECK(bytes[i] == i + 1);
  }

  auto const ack = mrvlink::encode(mrvlink::SyncAck{0x1, 0xAABB'CCDDU});
  CHECK(ack == std::array<std::uint8_t, 8>{0x01, 0, 0, 0, 0xDD, 0xCC, 0xBB, 0xAA});

  auto const query = mrvlink::encode(mrvlink::ChipRevQuery{});
  CHECK(query.size() == mrvlink::CHIP_REV_TX_BUF_SIZE);
  CHECK(ranges::all_of(query, [](auto t_byte) { return t_byte == 0; }));
}

TEST_CASE("decoding a short buffer fails with truncated frame", "[Frame Codec]") {
  std::vector<std::uint8_t> const seven_bytes(7, 0);
  CHECK_THROWS_AS(mrvlink::decode<mrvlink::SyncAck>(seven_bytes), mrvlink::TruncatedFrame);
  CHECK_THROWS_AS(mrvlink::decode<mrvlink::FrameHeader>(seven_bytes), mrvlink::TruncatedFrame);
  CHECK_THROWS_AS(mrvlink::decode<mrvlink::ChipRevResponse>(std::vector<std::uint8_t>(15, 0)),
                  mrvlink::TruncatedFrame);
  CHECK_THROWS_AS(mrvlink::decode_data_block(std::vector<std::uint8_t>(19, 0)), mrvlink::TruncatedFrame);

  SECTION("trailing bytes are ignored") {
    auto buffer = mrvlink::test::to_bytes(mrvlink::SyncAck{0, 42});
    buffer.resize(mrvlink::FW_DNLD_RX_BUF_SIZE, 0xFF);
    CHECK(mrvlink::decode<mrvlink::SyncAck>(buffer) == mrvlink::SyncAck{0, 42});
  }
}

TEST_CASE("every wire frame survives encode and decode", "[Frame Codec]") {
  auto const header = mrvlink::FrameHeader{1, 0x2000'0000U, 4, 0x1234'5678U};
  CHECK(mrvlink::decode<mrvlink::FrameHeader>(mrvlink::encode(header)) == header);

  auto const ack = mrvlink::SyncAck{0, 0xFFFF'FFFFU};
  CHECK(mrvlink::decode<mrvlink::SyncAck>(mrvlink::encode(ack)) == ack);

  auto const query = mrvlink::ChipRevQuery{};
  CHECK(mrvlink::decode<mrvlink::ChipRevQuery>(mrvlink::encode(query)) == query);

  auto const resp = mrvlink::ChipRevResponse{0x1, 0x2, mrvlink::EXTEND_MAGIC, mrvlink::USB8797_B0};
  CHECK(mrvlink::decode<mrvlink::ChipRevResponse>(mrvlink::encode(resp)) == resp);

  std::vector<std::uint8_t> const payload{0xC0, 0xFF, 0xEE, 0x00};
  auto const block   = mrvlink::DataBlock{header, 7, payload};
  auto const encoded = mrvlink::encode(block);
  auto const decoded = mrvlink::decode_data_block(encoded);
  CHECK(decoded.header_ == block.header_);
  CHECK(decoded.sequence_ == block.sequence_);
  CHECK(ranges::equal(decoded.payload_, payload));
}

TEST_CASE("data block is header, sequence number, then raw payload", "[Frame Codec]") {
  std::vector<std::uint8_t> const payload{0xAA, 0xBB, 0xCC};
  auto const packet = mrvlink::encode(mrvlink::DataBlock{mrvlink::FrameHeader{1, 0, 3, 0}, 0x0102'0304U, payload});

  REQUIRE(packet.size() == mrvlink::DataBlock::HEADER_SIZE + payload.size());
  CHECK(packet[16] == 0x04);
  CHECK(packet[17] == 0x03);
  CHECK(packet[18] == 0x02);
  CHECK(packet[19] == 0x01);
  CHECK(ranges::equal(std::span{packet}.subspan(mrvlink::DataBlock::HEADER_SIZE), payload));

  SECTION("payload shorter than declared is truncated") {
    auto const short_packet = std::vector<std::uint8_t>(packet.begin(), packet.end() - 1);
    CHECK_THROWS_AS(mrvlink::decode_data_block(short_packet), mrvlink::TruncatedFrame);
  }
}

TEST_CASE("CMD7 carries no payload whatever its data length says", "[Frame Codec]") {
  auto const cmd7 = mrvlink::FrameHeader{mrvlink::FW_CMD_7, 0, 128, 0};
  CHECK(cmd7.payload_length() == 0);
  CHECK(mrvlink::FrameHeader{1, 0, 128, 0}.payload_length() == 128);

  auto const packet  = mrvlink::encode(mrvlink::DataBlock{cmd7, 3, {}});
  auto const decoded = mrvlink::decode_data_block(packet);
  CHECK(packet.size() == mrvlink::DataBlock::HEADER_SIZE);
  CHECK(decoded.header_.data_length_ == 128);
  CHECK(decoded.payload_.empty());
}
