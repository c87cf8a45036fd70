#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mrv_common/error.hpp"
#include "mrv_common/utility.hpp"
#include "mrv_dnld/config.hpp"
#include "mrv_dnld/firmware_image.hpp"
#include "mrv_usb/frame.hpp"
#include "mrv_usb/transport.hpp"

namespace mrvlink {

struct TransferSummary {
  std::uint32_t blocks_ = 0;  // acknowledged blocks
  std::size_t bytes_    = 0;  // acknowledged payload bytes
};

/**
 * @brief Drives the block download: every firmware record is sent with its sequence number and must be acknowledged
 *        by the device before the next one is read.
 *
 *        ReadRecord -> SendBlock -> AwaitAck -> Advance -> ReadRecord ... -> Done
 *
 *        Transport failures on either direction consume the per block retry budget and resend the same block after a
 *        fixed backoff. A CRC error reported by the device, a sequence mismatch, an exhausted budget or an image that
 *        ends before the last block abort the whole download, there is no partial success.
 */
template <BulkTransport Transport>
class BlockTransfer {
  enum class State { ReadRecord, SendBlock, AwaitAck, Advance, Done };

  Transport& transport_;
  DownloadConfig config_;
  std::uint32_t sequence_ = 0;
  std::optional<std::uint32_t> last_acked_;
  std::vector<std::uint8_t> ack_buffer_;

  void consume_retry(int& t_retries, TransportError const& t_err) {
    spdlog::warn("Block {}: {}", this->sequence_, t_err.what());
    if (--t_retries <= 0) {
      throw ExhaustedRetries(this->sequence_, this->config_.max_retry_, t_err.what());
    }

    this->transport_.wait(this->config_.backoff_);
  }

  void check_ack(SyncAck const& t_ack) const {
    spdlog::debug("Sync header: cmd {:#x}, seq {}", t_ack.status_cmd_, t_ack.sequence_);
    if (t_ack.status_cmd_ > 0) {
      throw DeviceCrcError(this->sequence_, t_ack.status_cmd_);
    }

    if (t_ack.sequence_ != this->sequence_) {
      throw SequenceMismatch(this->sequence_, t_ack.sequence_);
    }
  }

  TransferSummary transfer(FirmwareImage& t_image) {
    TransferSummary summary;
    std::optional<FirmwareRecord> record;
    std::vector<std::uint8_t> packet;
    int retries = this->config_.max_retry_;

    this->sequence_ = 0;
    this->last_acked_.reset();

    for (auto state = State::ReadRecord; state != State::Done;) {
      switch (state) {
        case State::ReadRecord: {
          auto const offset = t_image.offset();
          record            = t_image.next_record();
          if (not record.has_value()) {
            throw TruncatedImage(
              fmt::format("Image ended at offset {:#x} without a last block (last acked block: {})", offset,
                          this->last_acked_.has_value() ? fmt::format("{}", *this->last_acked_) : "none"));
          }

          auto const& header = record->header_;
          spdlog::debug("FW Header: cmd {:#x}, base addr {:#010x}, data length {}, crc {:#010x}", header.dnld_cmd_,
                        header.base_addr_, header.data_length_, header.crc_);
          packet = encode(DataBlock{header, this->sequence_, record->payload_});
          state  = State::SendBlock;
          break;
        }
        case State::SendBlock:
          spdlog::info("Sending packet, seq: {} ({} byte)", this->sequence_, packet.size());
          if (spdlog::get_level() == spdlog::level::debug) {
            print_byte_stream(packet.begin(), packet.end());
          }

          try {
            this->transport_.bulk_write(this->config_.ep_out_, packet, this->config_.timeout_);
            state = State::AwaitAck;
          } catch (TransportError const& t_err) {
            this->consume_retry(retries, t_err);
          }
          break;
        case State::AwaitAck: {
          std::size_t byte_read = 0;
          try {
            byte_read = this->transport_.bulk_read(this->config_.ep_in_, this->ack_buffer_, this->config_.timeout_);
          } catch (TransportError const& t_err) {
            this->consume_retry(retries, t_err);
            state = State::SendBlock;
            break;
          }

          auto const received = std::span<std::uint8_t const>{this->ack_buffer_}.first(  //
            std::min(byte_read, this->ack_buffer_.size()));
          this->check_ack(decode<SyncAck>(received));

          this->last_acked_ = this->sequence_;
          summary.blocks_ += 1;
          summary.bytes_ += record->payload_.size();

          if (record->header_.dnld_cmd_ == this->config_.last_block_cmd_) {
            spdlog::info("Last block - finished! ({} blocks, {} bytes)", summary.blocks_, summary.bytes_);
            state = State::Done;
          } else {
            state = State::Advance;
          }
          break;
        }
        case State::Advance:
          retries = this->config_.max_retry_;
          ++this->sequence_;
          state = State::ReadRecord;
          break;
        case State::Done:
          break;
      }
    }

    return summary;
  }

 public:
  explicit BlockTransfer(Transport& t_transport, DownloadConfig const& t_config = {})
      : transport_{t_transport}, config_{t_config}, ack_buffer_(t_config.ack_buffer_size_) {}

  /**
   * @brief Download the whole image, always starting from sequence 0. Records are read with the CMD7 rule of the
   *        download config
   *
   * @return TransferSummary once the device acknowledged the last block
   * @throw TruncatedImage, TruncatedFrame, DeviceCrcError, SequenceMismatch, ExhaustedRetries
   */
  TransferSummary run(std::vector<std::uint8_t> t_content) {
    FirmwareImage image{std::move(t_content), this->config_.cmd7_};
    return this->transfer(image);
  }

  [[nodiscard]] std::uint32_t sequence() const noexcept { return this->sequence_; }
  [[nodiscard]] std::optional<std::uint32_t> last_acked_sequence() const noexcept { return this->last_acked_; }
};

}  // namespace mrvlink
