#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <set>
#include <span>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mrv_common/constants.hpp"
#include "mrv_common/error.hpp"
#include "mrv_usb/frame.hpp"
#include "mrv_usb/transport.hpp"

namespace mrvlink::test {

/**
 * @brief Scripted in memory device. Attempts listed in fail_writes_ / fail_reads_ (counted from 0 per direction)
 *        throw TransportError, reads are served from responses_ and, once that runs dry, answered with a good ack
 *        echoing the sequence number of the last written block.
 */
struct FakeTransport {
  std::set<int> fail_writes_;
  std::set<int> fail_reads_;
  std::deque<std::vector<std::uint8_t>> responses_;
  std::uint32_t cmd7_ = FW_CMD_7;

  int write_attempts_ = 0;
  int read_attempts_  = 0;
  std::vector<std::vector<std::uint8_t>> written_;
  std::vector<std::uint8_t> write_endpoints_;
  std::vector<std::uint8_t> read_endpoints_;
  std::vector<std::size_t> read_sizes_;
  std::vector<std::chrono::milliseconds> timeouts_;
  std::vector<std::chrono::milliseconds> waits_;

  void bulk_write(std::uint8_t const t_ep, std::span<std::uint8_t const> const t_data,
                  std::chrono::milliseconds const t_timeout) {
    this->write_endpoints_.push_back(t_ep);
    this->timeouts_.push_back(t_timeout);
    if (auto const attempt = this->write_attempts_++; this->fail_writes_.contains(attempt)) {
      throw TransportError(fmt::format("Bulk write to ep {:#04x} failed: LIBUSB_ERROR_TIMEOUT", t_ep));
    }

    this->written_.emplace_back(t_data.begin(), t_data.end());
  }

  std::size_t bulk_read(std::uint8_t const t_ep, std::span<std::uint8_t> const t_buffer,
                        std::chrono::milliseconds const t_timeout) {
    this->read_endpoints_.push_back(t_ep);
    this->read_sizes_.push_back(t_buffer.size());
    this->timeouts_.push_back(t_timeout);
    if (auto const attempt = this->read_attempts_++; this->fail_reads_.contains(attempt)) {
      throw TransportError(fmt::format("Bulk read from ep {:#04x} failed: LIBUSB_ERROR_TIMEOUT", t_ep));
    }

    std::vector<std::uint8_t> response;
    if (not this->responses_.empty()) {
      response = std::move(this->responses_.front());
      this->responses_.pop_front();
    } else {
      auto const sent = decode_data_block(this->written_.back(), this->cmd7_);
      auto const ack  = encode(SyncAck{0, sent.sequence_});
      response.assign(ack.begin(), ack.end());
    }

    auto const byte_read = std::min(response.size(), t_buffer.size());
    std::copy_n(response.begin(), byte_read, t_buffer.begin());
    return byte_read;
  }

  void wait(std::chrono::milliseconds const t_duration) { this->waits_.push_back(t_duration); }

  [[nodiscard]] std::vector<std::uint32_t> sent_sequences() const {
    std::vector<std::uint32_t> ret_val;
    for (auto const& packet : this->written_) {
      ret_val.push_back(decode_data_block(packet, this->cmd7_).sequence_);
    }

    return ret_val;
  }
};

static_assert(BulkTransport<FakeTransport>);

template <WireStruct T>
inline std::vector<std::uint8_t> to_bytes(T const& t_frame) {
  auto const arr = encode(t_frame);
  return {arr.begin(), arr.end()};
}

/**
 * @brief Append one (header, payload) record to a firmware image, data_length_ is taken from the header as given
 */
inline void append_record(std::vector<std::uint8_t>& t_image, FrameHeader const& t_header,
                          std::vector<std::uint8_t> const& t_payload = {}) {
  auto const header_arr = encode(t_header);
  t_image.insert(t_image.end(), header_arr.begin(), header_arr.end());
  t_image.insert(t_image.end(), t_payload.begin(), t_payload.end());
}

inline FrameHeader data_header(std::uint32_t const t_cmd, std::uint32_t const t_addr, std::size_t const t_length) {
  return FrameHeader{t_cmd, t_addr, static_cast<std::uint32_t>(t_length), 0xDEAD'BEEFU};
}

}  // namespace mrvlink::test
