#pragma once

#include <array>
#include <cstdint>
#include <iterator>
#include <range/v3/view/subrange.hpp>
#include <range/v3/view/transform.hpp>
#include <type_traits>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace mrvlink::detail {

template <typename T>
concept is_scoped_enum = std ::is_enum_v<T> and not std::is_convertible_v<int, T>;

}  // namespace mrvlink::detail

namespace mrvlink {

inline constexpr auto word_to_byte_array = [](std::uint32_t const t_v) {
  auto const high_halfword = t_v >> 16U;
  auto const low_halfword  = t_v & 0xFFFFU;
  return std::array{
    static_cast<std::uint8_t>(low_halfword & 0xFFU),
    static_cast<std::uint8_t>(low_halfword >> 8U),
    static_cast<std::uint8_t>(high_halfword & 0xFFU),
    static_cast<std::uint8_t>(high_halfword >> 8U),
  };
};

/**
 * @brief Assemble a little endian word starting at t_begin, caller guarantees at least 4 bytes are available
 */
inline constexpr auto byte_array_to_word = [](auto t_begin) {
  auto const byte_at = [&](int t_idx) { return static_cast<std::uint32_t>(static_cast<std::uint8_t>(t_begin[t_idx])); };
  return byte_at(0) | (byte_at(1) << 8U) | (byte_at(2) << 16U) | (byte_at(3) << 24U);
};

inline constexpr auto to_byte = [](auto t_in) { return static_cast<std::uint8_t>(t_in); };

inline constexpr auto to_underlying(detail::is_scoped_enum auto t_enum) noexcept {
  return static_cast<std::underlying_type_t<decltype(t_enum)>>(t_enum);
}

inline void print_byte_stream(auto t_begin, auto t_end) noexcept {
  using ranges::subrange;
  using ranges::views::transform;
  constexpr auto byte_per_line = 16;
  auto const byte_stream_size  = t_end - t_begin;
  auto const line_to_print = static_cast<std::size_t>((byte_stream_size + byte_per_line - 1) / byte_per_line);  // ceil
  spdlog::set_pattern("%v");

  for (std::size_t i = 0; i < line_to_print; ++i) {
    auto const curr_end = t_end - t_begin < byte_per_line ? t_end : t_begin + byte_per_line;
    spdlog::debug("{:04X}  {:02X}", i * byte_per_line,
                  fmt::join(subrange(t_begin, curr_end) | transform(to_byte), " "));
    t_begin = curr_end;
  }

  spdlog::debug("");
  spdlog::set_pattern("%+");
}

}  // namespace mrvlink
