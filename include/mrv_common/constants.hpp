#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace mrvlink {

inline constexpr std::uint16_t MARVELL_VENDOR_ID = 0x1286;

inline constexpr std::uint8_t BULK_EP_OUT = 0x01;
inline constexpr std::uint8_t BULK_EP_IN  = 0x81;

inline constexpr auto USB_BULK_MSG_TIMEOUT = std::chrono::milliseconds(100);
inline constexpr auto FW_RETRY_BACKOFF     = std::chrono::milliseconds(100);
inline constexpr int MAX_FW_RETRY          = 3;

inline constexpr std::size_t CHIP_REV_TX_BUF_SIZE = 16;
inline constexpr std::size_t CHIP_REV_RX_BUF_SIZE = 2048;
inline constexpr std::size_t FW_DNLD_RX_BUF_SIZE  = 2048;

// CMD7 carries no data, whatever its data_length field says
inline constexpr std::uint32_t FW_CMD_7          = 0x0000'0007;
inline constexpr std::uint32_t FW_HAS_LAST_BLOCK = 0x0000'0004;

inline constexpr std::uint32_t EXTEND_HDR   = 0xAB95;
inline constexpr std::uint32_t EXTEND_V1    = 0x0001;
inline constexpr std::uint32_t EXTEND_MAGIC = (EXTEND_HDR << 16U) | EXTEND_V1;

inline constexpr std::uint32_t USB8797_A0 = 0x0000'0000;
inline constexpr std::uint32_t USB8797_B0 = 0x0380'0010;

}  // namespace mrvlink
