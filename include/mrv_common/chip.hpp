#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

#include "mrv_common/constants.hpp"
#include "mrv_common/error.hpp"
#include "mrv_common/utility.hpp"

namespace mrvlink {

enum class MarvellChip : std::uint16_t {
  Avastar88W8782U = 0x2040,
  Avastar88W8897  = 0x2045,
};

[[nodiscard]] inline MarvellChip chip_from_product_id(std::uint16_t const t_pid) {
  switch (t_pid) {
    case to_underlying(MarvellChip::Avastar88W8782U):
      return MarvellChip::Avastar88W8782U;
    case to_underlying(MarvellChip::Avastar88W8897):
      return MarvellChip::Avastar88W8897;
    default:
      throw UnsupportedDevice(t_pid);
  }
}

[[nodiscard]] constexpr std::string_view get_chip_name(MarvellChip const t_chip) noexcept {
  switch (t_chip) {
    case MarvellChip::Avastar88W8782U:
      return "Avastar88W8782U";
    case MarvellChip::Avastar88W8897:
      return "Avastar88W8897";
  }

  return "Unknown";
}

inline auto get_revision_name(std::uint32_t const t_chip_rev) noexcept {
  constexpr std::array revision_table{
    std::pair{USB8797_A0, std::string_view{"USB8797_A0"}},
    std::pair{USB8797_B0, std::string_view{"USB8797_B0"}},
  };

  auto const rev_matched = [=](auto t_entry) { return t_entry.first == t_chip_rev; };
  if (auto const result = std::find_if(revision_table.begin(), revision_table.end(), rev_matched);
      result != revision_table.end()) {
    return result->second;
  }

  return std::string_view{"unknown"};
}

}  // namespace mrvlink
