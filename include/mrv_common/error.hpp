#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace mrvlink {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct TruncatedFrame : Error {
  TruncatedFrame(std::string_view const t_frame, std::size_t const t_expected, std::size_t const t_actual)
      : Error{fmt::format("{}: truncated frame, need {} bytes, got {}", t_frame, t_expected, t_actual)} {}
};

struct TruncatedImage : Error {
  using Error::Error;
};

/**
 * @brief Bulk transfer failure (including timeout), the only error recovered by retrying
 */
struct TransportError : Error {
  using Error::Error;
};

struct DeviceCrcError : Error {
  std::uint32_t sequence_;
  std::uint32_t status_;

  DeviceCrcError(std::uint32_t const t_seq, std::uint32_t const t_status)
      : Error{fmt::format("FW received block {} with CRC error (status: {:#x})", t_seq, t_status)},
        sequence_{t_seq},
        status_{t_status} {}
};

struct SequenceMismatch : Error {
  std::uint32_t expected_;
  std::uint32_t received_;

  SequenceMismatch(std::uint32_t const t_expected, std::uint32_t const t_received)
      : Error{fmt::format("Mismatch in seq, got {}, expected: {}", t_received, t_expected)},
        expected_{t_expected},
        received_{t_received} {}
};

struct ExhaustedRetries : Error {
  std::uint32_t sequence_;

  ExhaustedRetries(std::uint32_t const t_seq, int const t_retry, std::string_view const t_last_error)
      : Error{fmt::format("Block {}: transfer failed after retrying for {} times, last error: {}", t_seq, t_retry,
                          t_last_error)},
        sequence_{t_seq} {}
};

struct UnsupportedDevice : Error {
  std::uint16_t product_id_;

  explicit UnsupportedDevice(std::uint16_t const t_pid)
      : Error{fmt::format("Unhandled marvell device with pid: {:#X}", t_pid)}, product_id_{t_pid} {}
};

struct DeviceNotFound : Error {
  using Error::Error;
};

}  // namespace mrvlink
