#include "common/config.h"
#include "common/base58.h"
#include "common/logging.h"
#include <fstream>
#include <set>
#include <utility>
#include <vector>

namespace pinion {
namespace common {

namespace {

std::vector<std::pair<std::string, const std::string *>>
program_id_fields(const ProgramIdConfig &ids) {
  return {{"system", &ids.system},
          {"token", &ids.token},
          {"token_2022", &ids.token_2022},
          {"associated_token", &ids.associated_token},
          {"escrow", &ids.escrow},
          {"amm", &ids.amm},
          {"vault", &ids.vault}};
}

} // namespace

RuntimeConfig ConfigManager::create_default() { return RuntimeConfig(); }

std::optional<RuntimeConfig>
ConfigManager::load_from_file(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    LOG_CONFIG_ERROR("Cannot open configuration file", "CONFIG_OPEN",
                     {{"path", config_path}});
    return std::nullopt;
  }

  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error &e) {
    LOG_CONFIG_ERROR("Configuration file is not valid JSON", "CONFIG_PARSE",
                     {{"path", config_path}, {"reason", e.what()}});
    return std::nullopt;
  }

  return load_from_json(json);
}

bool ConfigManager::save_to_file(const RuntimeConfig &config,
                                 const std::string &config_path) {
  std::ofstream file(config_path);
  if (!file.is_open()) {
    LOG_CONFIG_ERROR("Cannot write configuration file", "CONFIG_WRITE",
                     {{"path", config_path}});
    return false;
  }
  file << to_json(config).dump(2) << std::endl;
  return file.good();
}

std::optional<RuntimeConfig>
ConfigManager::load_from_json(const nlohmann::json &json) {
  if (!json.is_object()) {
    LOG_CONFIG_ERROR("Configuration root must be an object", "CONFIG_SHAPE");
    return std::nullopt;
  }

  RuntimeConfig config = create_default();

  try {
    if (json.contains("program_ids")) {
      const auto &ids = json.at("program_ids");
      auto &out = config.program_ids;
      out.system = ids.value("system", out.system);
      out.token = ids.value("token", out.token);
      out.token_2022 = ids.value("token_2022", out.token_2022);
      out.associated_token =
          ids.value("associated_token", out.associated_token);
      out.escrow = ids.value("escrow", out.escrow);
      out.amm = ids.value("amm", out.amm);
      out.vault = ids.value("vault", out.vault);
    }

    if (json.contains("rent")) {
      const auto &rent = json.at("rent");
      config.rent.lamports_per_byte_year = rent.value(
          "lamports_per_byte_year", config.rent.lamports_per_byte_year);
      config.rent.exemption_threshold =
          rent.value("exemption_threshold", config.rent.exemption_threshold);
    }

    if (json.contains("runtime")) {
      const auto &runtime = json.at("runtime");
      config.runtime.max_compute_units =
          runtime.value("max_compute_units", config.runtime.max_compute_units);
      config.runtime.compute_units_per_instruction =
          runtime.value("compute_units_per_instruction",
                        config.runtime.compute_units_per_instruction);
      config.runtime.max_invoke_depth =
          runtime.value("max_invoke_depth", config.runtime.max_invoke_depth);
    }

    if (json.contains("logging")) {
      const auto &logging = json.at("logging");
      config.logging.level = logging.value("level", config.logging.level);
      config.logging.json = logging.value("json", config.logging.json);
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_CONFIG_ERROR("Configuration field has the wrong type", "CONFIG_TYPE",
                     {{"reason", e.what()}});
    return std::nullopt;
  }

  return config;
}

nlohmann::json ConfigManager::to_json(const RuntimeConfig &config) {
  nlohmann::json json;

  for (const auto &[name, value] : program_id_fields(config.program_ids)) {
    json["program_ids"][name] = *value;
  }

  json["rent"]["lamports_per_byte_year"] = config.rent.lamports_per_byte_year;
  json["rent"]["exemption_threshold"] = config.rent.exemption_threshold;

  json["runtime"]["max_compute_units"] = config.runtime.max_compute_units;
  json["runtime"]["compute_units_per_instruction"] =
      config.runtime.compute_units_per_instruction;
  json["runtime"]["max_invoke_depth"] = config.runtime.max_invoke_depth;

  json["logging"]["level"] = config.logging.level;
  json["logging"]["json"] = config.logging.json;

  return json;
}

std::string ConfigManager::validate_config(const RuntimeConfig &config) {
  return validate(config).message;
}

ValidationResult ConfigManager::validate(const RuntimeConfig &config) {
  ValidationResult result;

  std::set<std::string> seen;
  for (const auto &[name, value] : program_id_fields(config.program_ids)) {
    auto decoded = decode_pubkey(*value);
    if (decoded.is_err()) {
      result.error = ConfigError::INVALID_PROGRAM_ID;
      result.message = "Invalid program id for " + name + ": " +
                       decoded.error();
      result.field_path = "program_ids." + name;
      return result;
    }
    if (!seen.insert(*value).second) {
      result.error = ConfigError::DUPLICATE_PROGRAM_ID;
      result.message = "Program id for " + name + " is already in use";
      result.field_path = "program_ids." + name;
      return result;
    }
  }

  if (config.rent.lamports_per_byte_year == 0) {
    result.error = ConfigError::INVALID_VALUE_RANGE;
    result.message = "Rent lamports per byte-year must be positive";
    result.field_path = "rent.lamports_per_byte_year";
    return result;
  }

  if (config.rent.exemption_threshold < 1.0 ||
      config.rent.exemption_threshold > 100.0) {
    result.error = ConfigError::INVALID_VALUE_RANGE;
    result.message = "Rent exemption threshold must be between 1 and 100";
    result.field_path = "rent.exemption_threshold";
    return result;
  }

  if (config.runtime.max_compute_units == 0) {
    result.error = ConfigError::INVALID_VALUE_RANGE;
    result.message = "Compute budget must be positive";
    result.field_path = "runtime.max_compute_units";
    return result;
  }

  if (config.runtime.max_invoke_depth == 0 ||
      config.runtime.max_invoke_depth > 64) {
    result.error = ConfigError::INVALID_VALUE_RANGE;
    result.message = "Invoke depth must be between 1 and 64";
    result.field_path = "runtime.max_invoke_depth";
    return result;
  }

  if (!parse_log_level(config.logging.level)) {
    result.error = ConfigError::INVALID_LOG_LEVEL;
    result.message = "Invalid log level: " + config.logging.level;
    result.field_path = "logging.level";
    return result;
  }

  return result; // Valid
}

Result<ProgramIds>
ConfigManager::resolve_program_ids(const RuntimeConfig &config) {
  auto validation = validate(config);
  if (!validation.is_valid() &&
      (validation.error == ConfigError::INVALID_PROGRAM_ID ||
       validation.error == ConfigError::DUPLICATE_PROGRAM_ID)) {
    return Result<ProgramIds>(validation.message);
  }

  const auto &text = config.program_ids;
  ProgramIds ids;
  ids.system = decode_pubkey(text.system).value();
  ids.token = decode_pubkey(text.token).value();
  ids.token_2022 = decode_pubkey(text.token_2022).value();
  ids.associated_token = decode_pubkey(text.associated_token).value();
  ids.escrow = decode_pubkey(text.escrow).value();
  ids.amm = decode_pubkey(text.amm).value();
  ids.vault = decode_pubkey(text.vault).value();
  return Result<ProgramIds>(std::move(ids));
}

void ConfigManager::apply_logging(const RuntimeConfig &config) {
  auto level = parse_log_level(config.logging.level);
  if (level) {
    Logger::instance().set_level(*level);
  } else {
    LOG_WARN("config", "Unknown log level '", config.logging.level,
             "', keeping ", level_to_string(Logger::instance().level()));
  }
  Logger::instance().set_json_format(config.logging.json);
}

} // namespace common
} // namespace pinion
