#include "clearledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace clearledger {
namespace config {

namespace {

// Delimiters are stored as a single char; anything else in the file is kept
// as '\0' so validate() can report it.
char get_delimiter_or(const toml::table& tbl, std::string_view key, char default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return val->size() == 1 ? val->front() : '\0';
  }
  return default_val;
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

InputConfig parse_input(const toml::table& root) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.delimiter = get_delimiter_or(*input, "delimiter", cfg.delimiter);
    cfg.has_headers = get_bool_or(*input, "has_headers", cfg.has_headers);
    cfg.trim = get_bool_or(*input, "trim", cfg.trim);
    cfg.flexible = get_bool_or(*input, "flexible", cfg.flexible);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.delimiter = get_delimiter_or(*output, "delimiter", cfg.delimiter);
    cfg.sort_by_client = get_bool_or(*output, "sort_by_client", cfg.sort_by_client);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.warnings = get_bool_or(*logging, "warnings", cfg.warnings);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

LedgerConfig parse_config(const toml::table& root) {
  LedgerConfig cfg;
  cfg.input = parse_input(root);
  cfg.output = parse_output(root);
  cfg.logging = parse_logging(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

void validate_delimiter(char delimiter, const std::string& field, std::vector<ValidationError>& errors) {
  switch (delimiter) {
    case '\0':
      errors.push_back({field, "delimiter must be exactly one character"});
      break;
    case '"':
    case '.':
    case '\r':
    case '\n':
      errors.push_back({field, "delimiter cannot be a quote, a decimal point or a line break"});
      break;
    default:
      break;
  }
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const LedgerConfig& config) {
  std::vector<ValidationError> errors;
  validate_delimiter(config.input.delimiter, "input.delimiter", errors);
  validate_delimiter(config.output.delimiter, "output.delimiter", errors);
  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# clearledger configuration
# Generated default configuration

[input]
delimiter = ","
has_headers = true
trim = true
flexible = true   # rows may omit the trailing amount field

[output]
delimiter = ","
sort_by_client = false

[logging]
warnings = true   # report rejected records on stderr

[telemetry]
enabled = false   # print run counters on stderr at exit
)";
}

}  // namespace config
}  // namespace clearledger
