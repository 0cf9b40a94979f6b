// src/main.cpp
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/Errors.hpp"
#include "core/config/Config.hpp"
#include "core/device/FolderGateway.hpp"
#include "core/device/GPhotoGateway.hpp"
#include "core/metadata/Catalog.hpp"
#include "core/metadata/ExifToolReader.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataExtractor.hpp"
#include "core/sync/SyncPipeline.hpp"
#include "services/api/HttpServer.hpp"
#include "services/selection/ConsoleSelection.hpp"

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                 # create/upgrade the catalog schema\n"
            << "  " << argv0 << " --list-devices         # show attached cameras\n"
            << "  " << argv0 << " --sync [--days N] [--dest DIR] [--device N]\n"
            << "       [--folder DIR] [--review-port P]  # sync recent files and pick a subset\n"
            << "  " << argv0 << " --rebuild DIR          # rebuild the catalog from DIR\n";
}

static void setup_logging(const std::string& level) {
  // stdout carries the chosen paths; logs go to stderr
  auto logger = spdlog::stderr_color_mt("psm");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

static std::unique_ptr<psm::DeviceGateway> make_gateway(const psm::AppConfig& cfg) {
  if (!cfg.folder.empty()) return std::make_unique<psm::FolderGateway>(cfg.folder);
  return std::make_unique<psm::GPhotoGateway>();
}

static psm::DeviceHandle pick_device(psm::DeviceGateway& gw, const psm::AppConfig& cfg) {
  const auto devices = gw.enumerate();
  if (devices.empty()) throw psm::DeviceIndexError("no camera detected");
  if (!cfg.device) return devices.back();
  if (static_cast<size_t>(*cfg.device) >= devices.size()) {
    throw psm::DeviceIndexError("device " + std::to_string(*cfg.device) + " not found (" +
                                std::to_string(devices.size()) + " attached)");
  }
  return devices[static_cast<size_t>(*cfg.device)];
}

static std::vector<std::string> regular_files(const std::string& dir) {
  namespace fs = std::filesystem;
  std::vector<std::string> out;
  for (const auto& e : fs::directory_iterator(dir)) {
    if (e.is_regular_file()) out.push_back(e.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

static int run_sync(const psm::AppConfig& cfg) {
  auto gateway = make_gateway(cfg);
  const psm::DeviceHandle device = pick_device(*gateway, cfg);
  spdlog::info("syncing last {} days from {}", cfg.days, psm::describe(device));

  psm::Catalog catalog(cfg.db_path);
  psm::ExifToolReader reader(cfg.exiftool, cfg.extract_timeout);
  psm::MetadataExtractor extractor(reader);
  psm::SyncPipeline pipeline(*gateway, catalog, extractor,
                             psm::SyncOptions{cfg.collision, cfg.workers});

  const auto candidates = pipeline.syncAndCatalog(device, cfg.days, cfg.dest_dir);
  std::cerr << "Downloaded " << candidates.size() << " files\n";
  if (candidates.empty()) return 0;

  std::unique_ptr<psm::SelectionSurface> surface;
  if (cfg.review_port > 0) {
    surface = std::make_unique<psm::HttpSelection>(catalog, cfg.review_port, cfg.api_key);
  } else {
    surface = std::make_unique<psm::ConsoleSelection>(std::cin, std::cerr);
  }

  for (const auto& path : surface->choose(candidates)) std::cout << path << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const psm::AppConfig cfg = psm::load_config(argc, argv);
    setup_logging(cfg.log_level);

    switch (cfg.command) {
      case psm::Command::Init:
        psm::initDatabase(cfg.db_path);
        std::cout << "DB initialized at: " << cfg.db_path << "\n";
        return 0;

      case psm::Command::ListDevices: {
        auto gateway = make_gateway(cfg);
        for (const auto& d : gateway->enumerate()) {
          std::cout << psm::describe(d) << "  [" << d.model << " @ " << d.port << "]\n";
        }
        return 0;
      }

      case psm::Command::Sync:
        return run_sync(cfg);

      case psm::Command::Rebuild: {
        psm::Catalog catalog(cfg.db_path);
        psm::ExifToolReader reader(cfg.exiftool, cfg.extract_timeout);
        psm::MetadataExtractor extractor(reader);
        const auto stored = catalog.rebuild(regular_files(cfg.rebuild_dir), extractor, cfg.workers);
        std::cout << "Catalog rebuilt with " << stored << " records\n";
        return 0;
      }

      case psm::Command::None:
        break;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const psm::ConfigError& e) {
    std::cerr << "Config error: " << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
