#pragma once

#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <fmt/format.h>
#include <libusb.h>
#include <spdlog/spdlog.h>

#include "mrv_common/chip.hpp"
#include "mrv_common/constants.hpp"
#include "mrv_common/error.hpp"
#include "mrv_common/utility.hpp"
#include "mrv_usb/transport.hpp"

namespace mrvlink {

/**
 * @brief Exclusive handle to the first USB device of the given vendor, interface claimed for the lifetime of the
 *        object
 */
class UsbDevice {
  using ContextPtr = std::unique_ptr<libusb_context, decltype(&libusb_exit)>;
  using HandlePtr  = std::unique_ptr<libusb_device_handle, decltype(&libusb_close)>;
  using DeviceList = std::unique_ptr<libusb_device*, void (*)(libusb_device**)>;

  static constexpr int INTERFACE_NUMBER = 0;

  ContextPtr context_{nullptr, libusb_exit};
  HandlePtr handle_{nullptr, libusb_close};
  MarvellChip chip_{};
  bool claimed_ = false;
  boost::asio::io_context io_context_{};

  static ContextPtr make_context() {
    libusb_context* ctx = nullptr;
    if (auto const ret = libusb_init(&ctx); ret != LIBUSB_SUCCESS) {
      throw TransportError(fmt::format("libusb init failed: {}", libusb_error_name(ret)));
    }

    return ContextPtr{ctx, libusb_exit};
  }

  void open(std::uint16_t const t_vendor_id) {
    libusb_device** raw_list = nullptr;
    auto const device_count  = libusb_get_device_list(this->context_.get(), &raw_list);
    if (device_count < 0) {
      throw TransportError(
        fmt::format("Failed to enumerate USB devices: {}", libusb_error_name(static_cast<int>(device_count))));
    }

    DeviceList const devices{raw_list, [](libusb_device** t_list) { libusb_free_device_list(t_list, 1); }};
    for (auto i = 0; i < device_count; ++i) {
      auto* device = devices.get()[i];

      libusb_device_descriptor desc{};
      if (auto const ret = libusb_get_device_descriptor(device, &desc); ret != LIBUSB_SUCCESS) {
        spdlog::debug("Skipping device, unable to read descriptor: {}", libusb_error_name(ret));
        continue;
      }

      if (desc.idVendor != t_vendor_id) {
        continue;
      }

      spdlog::info("Found marvell device: Bus {:03} Device {:03} ID {:04x}:{:04x}", libusb_get_bus_number(device),
                   libusb_get_device_address(device), desc.idVendor, desc.idProduct);
      this->chip_ = chip_from_product_id(desc.idProduct);
      spdlog::info("Chip variant: {}", get_chip_name(this->chip_));

      libusb_device_handle* handle = nullptr;
      if (auto const ret = libusb_open(device, &handle); ret != LIBUSB_SUCCESS) {
        throw TransportError(fmt::format("Unable to open device: {}", libusb_error_name(ret)));
      }

      this->handle_.reset(handle);
      return;
    }

    throw DeviceNotFound(fmt::format("No device found with vendor id {:04x}", t_vendor_id));
  }

  void claim() {
    // not every platform supports detaching the kernel driver
    if (auto const ret = libusb_set_auto_detach_kernel_driver(this->handle_.get(), 1); ret != LIBUSB_SUCCESS) {
      spdlog::debug("Kernel driver auto detach unavailable: {}", libusb_error_name(ret));
    }

    if (auto const ret = libusb_claim_interface(this->handle_.get(), INTERFACE_NUMBER); ret != LIBUSB_SUCCESS) {
      throw TransportError(fmt::format("Unable to claim interface {}: {}", INTERFACE_NUMBER, libusb_error_name(ret)));
    }

    this->claimed_ = true;
  }

 public:
  UsbDevice(UsbDevice const&)            = delete;
  UsbDevice& operator=(UsbDevice const&) = delete;

  explicit UsbDevice(std::uint16_t const t_vendor_id = MARVELL_VENDOR_ID) : context_{make_context()} {
    this->open(t_vendor_id);
    this->claim();
  }

  [[nodiscard]] MarvellChip chip() const noexcept { return this->chip_; }

  void bulk_write(std::uint8_t const t_ep, std::span<std::uint8_t const> const t_data,
                  std::chrono::milliseconds const t_timeout) {
    int transferred = 0;
    // libusb takes a non const buffer for both directions, OUT transfers never write to it
    auto* const buffer = const_cast<unsigned char*>(t_data.data());
    auto const ret     = libusb_bulk_transfer(this->handle_.get(), t_ep, buffer, static_cast<int>(t_data.size()),
                                              &transferred, static_cast<unsigned int>(t_timeout.count()));
    if (ret != LIBUSB_SUCCESS) {
      throw TransportError(fmt::format("Bulk write to ep {:#04x} failed: {}", t_ep, libusb_error_name(ret)));
    }

    if (static_cast<std::size_t>(transferred) != t_data.size()) {
      throw TransportError(
        fmt::format("Short bulk write to ep {:#04x}: {} of {} bytes", t_ep, transferred, t_data.size()));
    }
  }

  std::size_t bulk_read(std::uint8_t const t_ep, std::span<std::uint8_t> const t_buffer,
                        std::chrono::milliseconds const t_timeout) {
    int transferred = 0;
    auto const ret  = libusb_bulk_transfer(this->handle_.get(), t_ep, t_buffer.data(), static_cast<int>(t_buffer.size()),
                                           &transferred, static_cast<unsigned int>(t_timeout.count()));
    if (ret != LIBUSB_SUCCESS) {
      throw TransportError(fmt::format("Bulk read from ep {:#04x} failed: {}", t_ep, libusb_error_name(ret)));
    }

    return static_cast<std::size_t>(transferred);
  }

  void wait(std::chrono::milliseconds const t_duration) {
    boost::asio::high_resolution_timer sleep_timer(this->io_context_);
    sleep_timer.expires_after(t_duration);
    sleep_timer.wait();
  }

  ~UsbDevice() {
    if (this->claimed_) {
      if (auto const ret = libusb_release_interface(this->handle_.get(), INTERFACE_NUMBER); ret != LIBUSB_SUCCESS) {
        spdlog::warn("Failed to release interface {}: {}", INTERFACE_NUMBER, libusb_error_name(ret));
      }
    }
  }
};

static_assert(BulkTransport<UsbDevice>);

}  // namespace mrvlink
