#include "mrv_common/chip.hpp"
#include "mrv_dnld/block_transfer.hpp"
#include "mrv_dnld/chip_rev.hpp"
#include "mrv_dnld/config.hpp"
#include "mrv_dnld/firmware_image.hpp"
#include "mrv_usb/usb_device.hpp"
#include <boost/program_options.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bpo = boost::program_options;

namespace {

void download_fw(std::filesystem::path const& t_file, mrvlink::DownloadConfig const& t_config, bool t_info_only) {
  auto image = [&]() {
    if (t_info_only) {
      return std::vector<std::uint8_t>{};
    }

    return mrvlink::load_firmware(t_file);
  }();

  mrvlink::UsbDevice device;
  spdlog::info("Starting fw download for {}", mrvlink::get_chip_name(device.chip()));

  auto const chip_rev = mrvlink::probe_chip_revision(device, t_config);
  if (t_info_only) {
    std::cout << "Chip variant:  " << mrvlink::get_chip_name(device.chip()) << '\n'
              << "Chip revision: " << fmt::format("{:#010x} ({}){}", chip_rev.revision_,
                                                  mrvlink::get_revision_name(chip_rev.revision_),
                                                  chip_rev.from_response_ ? "" : " (default)")
              << '\n';
    return;
  }

  mrvlink::BlockTransfer transfer{device, t_config};
  auto const summary = transfer.run(std::move(image));
  spdlog::info("Firmware download complete: {} blocks, {} bytes", summary.blocks_, summary.bytes_);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto const default_timeout = static_cast<int>(mrvlink::USB_BULK_MSG_TIMEOUT.count());
    auto const default_backoff = static_cast<int>(mrvlink::FW_RETRY_BACKOFF.count());

    bpo::options_description flash_options("Parameter for flash");
    flash_options.add_options()                                                                              //
      ("timeout", bpo::value<int>()->default_value(default_timeout), "Bulk transfer timeout in milliseconds")  //
      ("backoff", bpo::value<int>()->default_value(default_backoff), "Delay before resending a block in ms")   //
      ("retry", bpo::value<int>()->default_value(mrvlink::MAX_FW_RETRY), "Transfer attempts per block")       //
      ("info", "Probe chip variant and revision only, no download");

    bpo::options_description hidden_options("Hidden options");
    hidden_options.add_options()  //
      ("file", bpo::value<std::string>(), "firmware image");

    bpo::options_description visible_options("All options");
    visible_options.add(flash_options)
      .add_options()                               //
      ("help", "Show this help message and exit")  //
      ("verbose", "Show debug message during execution");

    bpo::positional_options_description pd;
    pd.add("file", 1);

    bpo::options_description all("Allowed options");
    all.add(hidden_options).add(visible_options);

    bpo::variables_map vm;
    bpo::store(bpo::command_line_parser(argc, argv).options(all).positional(pd).run(), vm);
    bpo::notify(vm);

    if (vm.count("help") != 0) {
      std::cout << "Usage: " << argv[0] << " [options] <fw filepath>\n" << visible_options << '\n';
      return EXIT_SUCCESS;
    }

    bool const info_only = vm.count("info") != 0;
    if (vm.count("file") == 0 and not info_only) {
      std::cerr << "Usage: " << argv[0] << " [options] <fw filepath>\n";
      return EXIT_FAILURE;
    }

    if (vm.count("verbose") != 0) {
      spdlog::set_level(spdlog::level::debug);
    }

    mrvlink::DownloadConfig config{};
    config.timeout_   = std::chrono::milliseconds(vm["timeout"].as<int>());
    config.backoff_   = std::chrono::milliseconds(vm["backoff"].as<int>());
    config.max_retry_ = vm["retry"].as<int>();
    mrvlink::validate(config);

    auto const file = vm.count("file") != 0 ? vm["file"].as<std::string>() : std::string{};
    download_fw(file, config, info_only);
  } catch (std::exception& t_e) {
    std::cerr << t_e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
