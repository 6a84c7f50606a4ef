#include "test_config.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>

#include "clearledger/config/config_loader.hpp"

namespace clearledger::tests {

void test_config_defaults() {
  auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.raw_error.empty());
  assert(result.config.input.delimiter == ',');
  assert(result.config.input.has_headers);
  assert(result.config.input.trim);
  assert(result.config.input.flexible);
  assert(result.config.output.delimiter == ',');
  assert(!result.config.output.sort_by_client);
  assert(result.config.logging.warnings);
  assert(!result.config.telemetry.enabled);

  // Missing sections fall back to the same defaults.
  auto empty = config::ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.input.delimiter == ',');
  assert(empty.config.logging.warnings);
}

void test_config_overrides() {
  namespace fs = std::filesystem;
  const auto tmp_root = fs::temp_directory_path() / "clearledger_tests";
  fs::remove_all(tmp_root);
  fs::create_directories(tmp_root);

  const auto path = tmp_root / "clearledger.toml";
  {
    std::ofstream out(path);
    out << "[input]\n"
           "delimiter = \";\"\n"
           "has_headers = false\n"
           "flexible = false\n"
           "[output]\n"
           "delimiter = \"\\t\"\n"
           "sort_by_client = true\n"
           "[logging]\n"
           "warnings = false\n"
           "[telemetry]\n"
           "enabled = true\n";
  }

  auto result = config::ConfigLoader::load(path);
  assert(result.success);
  assert(result.config.input.delimiter == ';');
  assert(!result.config.input.has_headers);
  assert(result.config.input.trim);
  assert(!result.config.input.flexible);
  assert(result.config.output.delimiter == '\t');
  assert(result.config.output.sort_by_client);
  assert(!result.config.logging.warnings);
  assert(result.config.telemetry.enabled);

  auto missing = config::ConfigLoader::load(tmp_root / "absent.toml");
  assert(!missing.success);
  assert(!missing.raw_error.empty());

  fs::remove_all(tmp_root);
}

void test_config_validation() {
  auto multi = config::ConfigLoader::load_from_string("[input]\ndelimiter = \",,\"\n");
  assert(!multi.success);
  assert(multi.errors.size() == 1);
  assert(multi.errors.front().field == "input.delimiter");

  auto dot = config::ConfigLoader::load_from_string("[output]\ndelimiter = \".\"\n");
  assert(!dot.success);
  assert(dot.errors.front().field == "output.delimiter");

  auto broken = config::ConfigLoader::load_from_string("[input\ndelimiter = ");
  assert(!broken.success);
  assert(!broken.raw_error.empty());
}

}  // namespace clearledger::tests
