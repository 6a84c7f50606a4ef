#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clearledger {
namespace config {

struct InputConfig {
  char delimiter{','};
  bool has_headers{true};
  bool trim{true};
  bool flexible{true};
};

struct OutputConfig {
  char delimiter{','};
  bool sort_by_client{false};
};

struct LoggingConfig {
  bool warnings{true};
};

struct TelemetryConfig {
  bool enabled{false};
};

struct LedgerConfig {
  InputConfig input;
  OutputConfig output;
  LoggingConfig logging;
  TelemetryConfig telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LedgerConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LedgerConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace clearledger
