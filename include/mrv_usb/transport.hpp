#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace mrvlink {

/**
 * @brief Blocking bulk endpoint access. Both transfers throw TransportError on failure or timeout,
 *        bulk_read returns the number of bytes actually received. wait is the retry backoff.
 */
template <typename T>
concept BulkTransport = requires(T& t_transport, std::uint8_t const t_ep, std::span<std::uint8_t const> t_out,
                                 std::span<std::uint8_t> t_in, std::chrono::milliseconds const t_timeout) {
  t_transport.bulk_write(t_ep, t_out, t_timeout);
  { t_transport.bulk_read(t_ep, t_in, t_timeout) } -> std::convertible_to<std::size_t>;
  t_transport.wait(t_timeout);
};

}  // namespace mrvlink
