#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "mrv_common/constants.hpp"
#include "mrv_common/error.hpp"
#include "mrv_common/utility.hpp"

namespace mrvlink {

/**
 * @brief A fixed width frame made of little endian 32 bit words, field order is the wire order
 */
template <typename T>
concept WireStruct = requires {
  { T::NAME } -> std::convertible_to<std::string_view>;
  { T::WIRE_SIZE } -> std::convertible_to<std::size_t>;
} and std::is_trivially_copyable_v<T> and sizeof(T) == T::WIRE_SIZE and T::WIRE_SIZE % sizeof(std::uint32_t) == 0;

struct FrameHeader {
  std::uint32_t dnld_cmd_;
  std::uint32_t base_addr_;
  std::uint32_t data_length_;
  std::uint32_t crc_;

  static constexpr std::string_view NAME = "FrameHeader";
  static constexpr std::size_t WIRE_SIZE = 4 * sizeof(std::uint32_t);

  [[nodiscard]] constexpr std::uint32_t payload_length(std::uint32_t const t_cmd7 = FW_CMD_7) const noexcept {
    return this->dnld_cmd_ == t_cmd7 ? 0U : this->data_length_;
  }

  constexpr bool operator==(FrameHeader const& /* unused */) const noexcept = default;
};

struct SyncAck {
  std::uint32_t status_cmd_;  // non zero: device detected a CRC error in the last block
  std::uint32_t sequence_;

  static constexpr std::string_view NAME = "SyncAck";
  static constexpr std::size_t WIRE_SIZE = 2 * sizeof(std::uint32_t);

  constexpr bool operator==(SyncAck const& /* unused */) const noexcept = default;
};

struct ChipRevQuery {
  std::array<std::uint32_t, CHIP_REV_TX_BUF_SIZE / sizeof(std::uint32_t)> reserved_{};

  static constexpr std::string_view NAME = "ChipRevQuery";
  static constexpr std::size_t WIRE_SIZE = CHIP_REV_TX_BUF_SIZE;

  constexpr bool operator==(ChipRevQuery const& /* unused */) const noexcept = default;
};

struct ChipRevResponse {
  std::uint32_t ack_marker_;
  std::uint32_t sequence_;
  std::uint32_t extend_;
  std::uint32_t chip_rev_;

  static constexpr std::string_view NAME = "ChipRevResponse";
  static constexpr std::size_t WIRE_SIZE = 4 * sizeof(std::uint32_t);

  [[nodiscard]] constexpr bool has_extension() const noexcept { return this->extend_ == EXTEND_MAGIC; }

  constexpr bool operator==(ChipRevResponse const& /* unused */) const noexcept = default;
};

static_assert(WireStruct<FrameHeader>);
static_assert(WireStruct<SyncAck>);
static_assert(WireStruct<ChipRevQuery>);
static_assert(WireStruct<ChipRevResponse>);

template <WireStruct T>
[[nodiscard]] constexpr auto encode(T const& t_frame) noexcept {
  constexpr auto WORD_COUNT = T::WIRE_SIZE / sizeof(std::uint32_t);
  auto const words          = std::bit_cast<std::array<std::uint32_t, WORD_COUNT>>(t_frame);

  std::array<std::uint8_t, T::WIRE_SIZE> ret_val{};
  auto iter = ret_val.begin();
  for (auto const word : words) {
    auto const byte_arr = word_to_byte_array(word);
    iter                = std::copy(byte_arr.begin(), byte_arr.end(), iter);
  }

  return ret_val;
}

/**
 * @brief Decode a frame from the front of t_bytes, trailing bytes are ignored
 *
 * @throw TruncatedFrame if fewer than T::WIRE_SIZE bytes are available
 */
template <WireStruct T>
[[nodiscard]] T decode(std::span<std::uint8_t const> const t_bytes) {
  if (t_bytes.size() < T::WIRE_SIZE) {
    throw TruncatedFrame(T::NAME, T::WIRE_SIZE, t_bytes.size());
  }

  std::array<std::uint32_t, T::WIRE_SIZE / sizeof(std::uint32_t)> words{};
  for (std::size_t i = 0; i < words.size(); ++i) {
    words[i] = byte_array_to_word(t_bytes.data() + i * sizeof(std::uint32_t));
  }

  return std::bit_cast<T>(words);
}

/**
 * @brief One firmware block as sent to the device: header, engine assigned sequence number, then the raw payload.
 *        The payload is not owned, it refers to the firmware image (or to the buffer it was decoded from)
 */
struct DataBlock {
  FrameHeader header_;
  std::uint32_t sequence_;
  std::span<std::uint8_t const> payload_;

  static constexpr std::string_view NAME   = "DataBlock";
  static constexpr std::size_t HEADER_SIZE = FrameHeader::WIRE_SIZE + sizeof(std::uint32_t);
};

[[nodiscard]] inline std::vector<std::uint8_t> encode(DataBlock const& t_block) {
  auto const header_arr   = encode(t_block.header_);
  auto const sequence_arr = word_to_byte_array(t_block.sequence_);

  std::vector<std::uint8_t> ret_val;
  ret_val.reserve(DataBlock::HEADER_SIZE + t_block.payload_.size());
  ret_val.insert(ret_val.end(), header_arr.begin(), header_arr.end());
  ret_val.insert(ret_val.end(), sequence_arr.begin(), sequence_arr.end());
  ret_val.insert(ret_val.end(), t_block.payload_.begin(), t_block.payload_.end());
  return ret_val;
}

/**
 * @brief Decode a data block, the payload length is taken from the header (zero for CMD7)
 *
 * @throw TruncatedFrame if the header, sequence number or payload is incomplete
 */
[[nodiscard]] inline DataBlock decode_data_block(std::span<std::uint8_t const> const t_bytes,
                                                 std::uint32_t const t_cmd7 = FW_CMD_7) {
  if (t_bytes.size() < DataBlock::HEADER_SIZE) {
    throw TruncatedFrame(DataBlock::NAME, DataBlock::HEADER_SIZE, t_bytes.size());
  }

  auto const header         = decode<FrameHeader>(t_bytes);
  auto const payload_length = header.payload_length(t_cmd7);
  if (auto const expected = DataBlock::HEADER_SIZE + payload_length; t_bytes.size() < expected) {
    throw TruncatedFrame(DataBlock::NAME, expected, t_bytes.size());
  }

  return DataBlock{
    .header_   = header,
    .sequence_ = byte_array_to_word(t_bytes.data() + FrameHeader::WIRE_SIZE),
    .payload_  = t_bytes.subspan(DataBlock::HEADER_SIZE, payload_length),
  };
}

}  // namespace mrvlink
