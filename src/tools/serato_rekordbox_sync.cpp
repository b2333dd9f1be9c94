#include "seratorekordbox.h"

#include <getopt.h>
#include <pthread.h>
#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Usage:
//   serato_rekordbox_sync <convert|watch> [options]
// Converts the Serato crates below the crate root into a Rekordbox XML file. "watch" keeps running
// and reconverts whenever a crate changes, until interrupted.

namespace {

const int kExitUsage = 2;

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <convert|watch> [options]\n"
               "Options:\n"
               "  --crate-root <dir>         Directory containing .crate files\n"
               "                             (default: " << defaultCrateRoot().string() << ")\n"
               "  --output <file>            Destination Rekordbox XML file\n"
               "                             (default: " << defaultOutputPath().string() << ")\n"
               "  --product-name <name>      Product name to embed in the XML\n"
               "  --product-version <ver>    Version string to embed in the XML\n"
               "  --interval <seconds>       Polling interval for watch mode (default: 30)\n"
               "  --dry-run                  Load crates and report a summary without writing XML\n"
               "  --verbose                  Enable debug logging\n";
}

void initLogger(bool verbose) {
  try {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("serato_rekordbox_sync", console_sink);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << "\n";
  }
}

// Blocks SIGINT and SIGTERM in every thread and stops the watch loop from a dedicated thread once
// either arrives.
void stopOnSignal(StopSignal* stop) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::thread([signals, stop]() {
    int signal_number = 0;
    if (sigwait(&signals, &signal_number) == 0) {
      spdlog::info("Stopped by signal {}", signal_number);
    }
    stop->stop();
  }).detach();
}

}  // namespace

int main(int argc, char** argv) {
  ConverterConfig config;
  config.crate_root = defaultCrateRoot();
  config.output = defaultOutputPath();
  long interval_seconds = 30;
  bool dry_run = false;
  bool verbose = false;

  static struct option long_options[] = {
    {"crate-root",      required_argument, nullptr, 'c'},
    {"output",          required_argument, nullptr, 'o'},
    {"product-name",    required_argument, nullptr, 'n'},
    {"product-version", required_argument, nullptr, 'V'},
    {"interval",        required_argument, nullptr, 'i'},
    {"dry-run",         no_argument,       nullptr, 'd'},
    {"verbose",         no_argument,       nullptr, 'v'},
    {"help",            no_argument,       nullptr, 'h'},
    {nullptr,           0,                 nullptr,  0 }
  };

  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'c':
        config.crate_root = optarg;
        break;
      case 'o':
        config.output = optarg;
        break;
      case 'n':
        config.product_name = optarg;
        break;
      case 'V':
        config.product_version = optarg;
        break;
      case 'i': {
        char* end = nullptr;
        interval_seconds = std::strtol(optarg, &end, 10);
        if (end == optarg || *end != '\0' || interval_seconds <= 0) {
          std::cerr << "Invalid --interval value: " << optarg << "\n";
          return kExitUsage;
        }
        break;
      }
      case 'd':
        dry_run = true;
        break;
      case 'v':
        verbose = true;
        break;
      case 'h':
        printUsage(argv[0]);
        return EXIT_SUCCESS;
      default:
        printUsage(argv[0]);
        return kExitUsage;
    }
  }

  if (optind != argc - 1) {
    printUsage(argv[0]);
    return kExitUsage;
  }
  std::string command = argv[optind];
  if (command != "convert" && command != "watch") {
    std::cerr << "Unknown command " << command << "\n";
    printUsage(argv[0]);
    return kExitUsage;
  }

  initLogger(verbose);

  try {
    Converter converter(config);

    if (command == "convert") {
      spdlog::info("Converting crates from {} -> {}", config.crate_root.string(),
                   config.output.string());
      ConversionSummary summary = converter.runOnce(!dry_run);
      if (dry_run) {
        spdlog::info("Dry run complete, XML was not written");
      } else {
        spdlog::info("Finished writing {}", summary.output.string());
      }
      logSummary(summary);
      return EXIT_SUCCESS;
    }

    StopSignal stop;
    stopOnSignal(&stop);
    spdlog::info("Watching {} for changes (interval {}s)", config.crate_root.string(),
                 interval_seconds);
    converter.watch(std::chrono::seconds(interval_seconds), &stop);
    return EXIT_SUCCESS;
  } catch (const ConfigException& e) {
    spdlog::error("{}", e.what());
    return kExitUsage;
  } catch (const ReadException& e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  } catch (const WriteException& e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
}
