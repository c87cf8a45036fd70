#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mrv_common/constants.hpp"
#include "mrv_common/error.hpp"
#include "mrv_usb/frame.hpp"

namespace mrvlink {

struct FirmwareRecord {
  FrameHeader header_;
  std::span<std::uint8_t const> payload_;  // points into the image
};

/**
 * @brief Forward only cursor over a firmware image, the image is a plain concatenation of
 *        (FrameHeader, payload) records
 */
class FirmwareImage {
  std::vector<std::uint8_t> content_;
  std::size_t cursor_ = 0;
  std::uint32_t cmd7_;

 public:
  explicit FirmwareImage(std::vector<std::uint8_t> t_content, std::uint32_t const t_cmd7 = FW_CMD_7) noexcept
      : content_{std::move(t_content)}, cmd7_{t_cmd7} {}

  /**
   * @brief Decode the record at the cursor and move past it
   *
   * @return std::nullopt once the cursor sits exactly at the end of the image
   * @throw TruncatedImage if the header or the payload it declares runs past the end of the image
   */
  [[nodiscard]] std::optional<FirmwareRecord> next_record() {
    if (this->exhausted()) {
      return std::nullopt;
    }

    auto const remaining = std::span<std::uint8_t const>{this->content_}.subspan(this->cursor_);
    if (remaining.size() < FrameHeader::WIRE_SIZE) {
      throw TruncatedImage(fmt::format("Truncated image: {} bytes left at offset {:#x}, header needs {}",
                                       remaining.size(), this->cursor_, FrameHeader::WIRE_SIZE));
    }

    auto const header         = decode<FrameHeader>(remaining);
    auto const payload_length = header.payload_length(this->cmd7_);
    if (remaining.size() - FrameHeader::WIRE_SIZE < payload_length) {
      throw TruncatedImage(fmt::format("Truncated image: block at offset {:#x} declares {} data bytes, only {} left",
                                       this->cursor_, payload_length, remaining.size() - FrameHeader::WIRE_SIZE));
    }

    this->cursor_ += FrameHeader::WIRE_SIZE + payload_length;
    return FirmwareRecord{header, remaining.subspan(FrameHeader::WIRE_SIZE, payload_length)};
  }

  [[nodiscard]] bool exhausted() const noexcept { return this->cursor_ >= this->content_.size(); }
  [[nodiscard]] std::size_t offset() const noexcept { return this->cursor_; }
  [[nodiscard]] std::size_t size() const noexcept { return this->content_.size(); }
};

inline std::vector<std::uint8_t> load_firmware(std::filesystem::path const& t_file) {
  std::ifstream file(t_file, std::ios::binary | std::ios::in);
  if (not file.is_open()) {
    throw std::runtime_error(fmt::format("Unable to open firmware file: {}", t_file.string()));
  }

  std::vector<std::uint8_t> ret_val;
  ret_val.insert(ret_val.begin(), std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error(fmt::format("Failed reading firmware file: {}", t_file.string()));
  }

  spdlog::info("Read fw {} ({} bytes)", t_file.string(), ret_val.size());
  return ret_val;
}

}  // namespace mrvlink
