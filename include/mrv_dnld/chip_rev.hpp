#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "mrv_common/chip.hpp"
#include "mrv_common/constants.hpp"
#include "mrv_common/utility.hpp"
#include "mrv_dnld/config.hpp"
#include "mrv_usb/frame.hpp"
#include "mrv_usb/transport.hpp"

namespace mrvlink {

struct ChipRevision {
  std::uint32_t revision_ = USB8797_A0;
  bool from_response_     = false;
};

/**
 * @brief Send the zero filled extended query once and read back the chip revision. The revision in the response is
 *        only trusted if it carries the extension magic, otherwise USB8797_A0 is assumed. Transport errors are not
 *        retried and propagate to the caller.
 */
template <BulkTransport Transport>
[[nodiscard]] ChipRevision probe_chip_revision(Transport& t_transport, DownloadConfig const& t_config = {}) {
  auto const query = encode(ChipRevQuery{});
  spdlog::debug("Sending chip rev query: ({} byte)\n", query.size());
  if (spdlog::get_level() == spdlog::level::debug) {
    print_byte_stream(query.begin(), query.end());
  }

  t_transport.bulk_write(t_config.ep_out_, query, t_config.timeout_);

  std::vector<std::uint8_t> recv_buffer(t_config.chip_rev_rx_size_);
  auto const byte_read = std::min<std::size_t>(t_transport.bulk_read(t_config.ep_in_, recv_buffer, t_config.timeout_),
                                               recv_buffer.size());
  auto const received  = std::span<std::uint8_t const>{recv_buffer}.first(byte_read);
  spdlog::debug("Chip rev response: ({} byte)\n", byte_read);
  if (spdlog::get_level() == spdlog::level::debug) {
    print_byte_stream(received.begin(), received.end());
  }

  ChipRevision ret_val{};
  if (received.size() < ChipRevResponse::WIRE_SIZE) {
    spdlog::warn("Chip rev response too short ({} byte), assuming {}", received.size(),
                 get_revision_name(ret_val.revision_));
    return ret_val;
  }

  auto const resp = decode<ChipRevResponse>(received);
  spdlog::debug("Chiprev resp: ack {:#x}, seq {}, extend {:#010x}, chip rev {:#010x}", resp.ack_marker_, resp.sequence_,
                resp.extend_, resp.chip_rev_);

  if (resp.has_extension()) {
    ret_val = ChipRevision{resp.chip_rev_, true};
    spdlog::info("Chip Rev: {:#010x} ({}) (From Response)", ret_val.revision_, get_revision_name(ret_val.revision_));
  } else {
    spdlog::info("Chip Rev: {:#010x} ({})", ret_val.revision_, get_revision_name(ret_val.revision_));
  }

  return ret_val;
}

}  // namespace mrvlink
