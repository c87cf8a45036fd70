#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "mrv_common/constants.hpp"

namespace mrvlink {

struct DownloadConfig {
  std::uint8_t ep_out_                = BULK_EP_OUT;
  std::uint8_t ep_in_                 = BULK_EP_IN;
  std::chrono::milliseconds timeout_  = USB_BULK_MSG_TIMEOUT;
  std::chrono::milliseconds backoff_  = FW_RETRY_BACKOFF;
  int max_retry_                      = MAX_FW_RETRY;
  std::size_t ack_buffer_size_        = FW_DNLD_RX_BUF_SIZE;
  std::size_t chip_rev_rx_size_       = CHIP_REV_RX_BUF_SIZE;
  std::uint32_t cmd7_                 = FW_CMD_7;
  std::uint32_t last_block_cmd_       = FW_HAS_LAST_BLOCK;
};

/**
 * @brief Reject settings the transfer can't work with. A zero timeout would mean "wait forever" to libusb
 *
 * @throw std::invalid_argument
 */
inline void validate(DownloadConfig const& t_config) {
  if (t_config.max_retry_ < 1) {
    throw std::invalid_argument(fmt::format("Retry count must be at least 1, got {}", t_config.max_retry_));
  }

  if (t_config.timeout_.count() <= 0) {
    throw std::invalid_argument(fmt::format("USB timeout must be positive, got {}", t_config.timeout_));
  }

  if (t_config.backoff_.count() < 0) {
    throw std::invalid_argument(fmt::format("Retry backoff must not be negative, got {}", t_config.backoff_));
  }
}

}  // namespace mrvlink
