#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string_view>
#include <utility>

#include "clearledger/common/errors.hpp"
#include "clearledger/config/config_loader.hpp"
#include "clearledger/ingest/csv_reader.hpp"
#include "clearledger/ledger/ledger_state.hpp"
#include "clearledger/replay/replay_driver.hpp"
#include "clearledger/snapshot/snapshot_store.hpp"
#include "clearledger/telemetry/telemetry_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [--config <config_file>] <input-file>\n"
            << "  input-file:  CSV file with type,client,tx,amount rows\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./clearledger.toml or built-in defaults\n";
}

struct Arguments {
  std::filesystem::path config_path;
  std::filesystem::path input_path;
};

bool parse_arguments(int argc, char* argv[], Arguments& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return false;
      }
      out.config_path = argv[++i];
    } else if (out.input_path.empty()) {
      out.input_path = argv[i];
    } else {
      return false;
    }
  }
  return !out.input_path.empty();
}

std::filesystem::path find_config_path(const Arguments& args) {
  if (!args.config_path.empty()) {
    return args.config_path;
  }

  std::filesystem::path default_paths[] = {
      "./clearledger.toml",
      "/etc/clearledger/clearledger.toml",
      std::filesystem::path{getenv("HOME") ? getenv("HOME") : ""} / ".config/clearledger/clearledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& config_path, clearledger::config::LedgerConfig& cfg) {
  using clearledger::config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void print_telemetry(clearledger::telemetry::TelemetrySink& sink) {
  for (const auto& sample : sink.drain()) {
    std::cerr << "  " << clearledger::telemetry::metric_name(sample.id) << ": " << sample.value << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace clearledger;

  Arguments args;
  if (!parse_arguments(argc, argv, args)) {
    print_usage(argv[0]);
    return 1;
  }

  config::LedgerConfig cfg;
  if (!load_config(find_config_path(args), cfg)) {
    return 1;
  }

  std::ifstream input(args.input_path);
  if (!input) {
    std::cerr << "Failed to open the input file " << args.input_path.string() << ": " << std::strerror(errno)
              << "\n";
    return 1;
  }

  ingest::CsvReader reader(input, {
      .delimiter = cfg.input.delimiter,
      .has_headers = cfg.input.has_headers,
      .trim = cfg.input.trim,
      .flexible = cfg.input.flexible,
  });

  telemetry::TelemetrySink telemetry;
  replay::Driver driver;
  if (cfg.telemetry.enabled) {
    driver.set_telemetry(&telemetry);
  }
  if (cfg.logging.warnings) {
    driver.set_warning_handler([](const common::TransactionRecord&, const processor::Outcome& outcome) {
      std::cerr << outcome.message << "\n";
    });
  }

  ledger::LedgerState ledger;
  try {
    ledger = driver.execute(reader);
  } catch (const common::ProcessingError& e) {
    std::cerr << "Failed to parse CSV input (" << common::to_string(e.kind()) << "): " << e.what() << "\n";
    if (cfg.telemetry.enabled) {
      print_telemetry(telemetry);
    }
    return 1;
  }

  try {
    const auto accounts = snapshot::snapshot(ledger);
    snapshot::CsvWriter writer(std::cout, {
        .delimiter = cfg.output.delimiter,
        .sort_by_client = cfg.output.sort_by_client,
    });
    writer.write(accounts);
  } catch (const std::exception& e) {
    std::cerr << "Failed to print the ledger: " << e.what() << "\n";
    return 1;
  }

  if (cfg.telemetry.enabled) {
    print_telemetry(telemetry);
  }
  return 0;
}
