#include "common/base58.h"
#include "common/byte_codec.h"
#include "common/config.h"
#include "common/logging.h"
#include "common/types.h"
#include "test_framework.h"
#include <cstdio>
#include <fstream>

using namespace pinion::common;

void test_result_type() {
  Result<int> success_result(42);
  ASSERT_TRUE(success_result.is_ok());
  ASSERT_FALSE(success_result.is_err());
  ASSERT_EQ(42, success_result.value());

  Result<int> error_result("Something went wrong");
  ASSERT_FALSE(error_result.is_ok());
  ASSERT_TRUE(error_result.is_err());
  ASSERT_TRUE(error_result.error() == "Something went wrong");
  ASSERT_EQ(7, error_result.value_or(7));
}

void test_result_type_move_semantics() {
  Result<PublicKey> result(PublicKey(32, 0xAB));
  ASSERT_TRUE(result.is_ok());

  PublicKey moved = std::move(result).value();
  ASSERT_EQ(static_cast<size_t>(32), moved.size());
}

void test_zero_key_detection() {
  ASSERT_TRUE(is_zero_key(PublicKey(32, 0)));
  ASSERT_FALSE(is_zero_key(PublicKey(31, 0)));

  PublicKey almost_zero(32, 0);
  almost_zero[31] = 1;
  ASSERT_FALSE(is_zero_key(almost_zero));
}

void test_base58_known_values() {
  ASSERT_EQ(std::string("11111111111111111111111111111111"),
            encode_base58(PublicKey(32, 0)));

  auto token = decode_pubkey("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  ASSERT_TRUE(token.is_ok());
  ASSERT_EQ(static_cast<uint8_t>(0x06), token.value()[0]);
  ASSERT_EQ(static_cast<uint8_t>(0xa9), token.value()[31]);
  ASSERT_EQ(std::string("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"),
            encode_base58(token.value()));
}

void test_base58_rejects_bad_input() {
  // '0', 'O', 'I' and 'l' are not in the alphabet
  ASSERT_TRUE(decode_base58("0OIl").is_err());
  ASSERT_TRUE(decode_pubkey("abc").is_err());

  auto leading_zeros = decode_base58("11");
  ASSERT_TRUE(leading_zeros.is_ok());
  ASSERT_EQ(static_cast<size_t>(2), leading_zeros.value().size());
}

void test_byte_reader_bounds() {
  std::vector<uint8_t> data = {0x01, 0x02, 0x03};
  ByteReader reader(data);

  uint16_t value = 0;
  ASSERT_TRUE(reader.read_u16(value));
  ASSERT_EQ(static_cast<uint16_t>(0x0201), value);

  uint64_t too_long = 0;
  ASSERT_FALSE(reader.read_u64(too_long));
  ASSERT_EQ(static_cast<size_t>(1), reader.remaining());

  bool flag = false;
  ASSERT_FALSE(reader.read_bool(flag)); // 0x03 is not a boolean
  uint8_t last = 0;
  ASSERT_TRUE(reader.read_u8(last));
  ASSERT_TRUE(reader.exhausted());
}

void test_byte_writer_layout() {
  ByteWriter writer;
  writer.write_u8(9).write_u64(1).write_i64(-1).write_pubkey(PublicKey(32, 0x11));
  const auto &bytes = writer.bytes();
  ASSERT_EQ(static_cast<size_t>(1 + 8 + 8 + 32), bytes.size());
  ASSERT_EQ(static_cast<uint8_t>(9), bytes[0]);
  ASSERT_EQ(static_cast<uint8_t>(1), bytes[1]);
  ASSERT_EQ(static_cast<uint8_t>(0xff), bytes[9]);
  ASSERT_EQ(static_cast<uint8_t>(0x11), bytes[17]);

  ASSERT_EQ(u64_le_bytes(0x0102), (std::vector<uint8_t>{0x02, 0x01, 0, 0, 0, 0, 0, 0}));
}

void test_config_defaults() {
  RuntimeConfig config = ConfigManager::create_default();
  ASSERT_EQ(static_cast<uint64_t>(3480), config.rent.lamports_per_byte_year);
  ASSERT_EQ(static_cast<uint64_t>(200000), config.runtime.max_compute_units);
  ASSERT_EQ(static_cast<uint32_t>(4), config.runtime.max_invoke_depth);
  ASSERT_EQ(std::string("INFO"), config.logging.level);
  ASSERT_EQ(std::string(""), ConfigManager::validate_config(config));

  auto ids = ConfigManager::resolve_program_ids(config);
  ASSERT_TRUE(ids.is_ok());
  ASSERT_TRUE(is_zero_key(ids.value().system));
  ASSERT_TRUE(ids.value().is_token_program(ids.value().token_2022));
  ASSERT_FALSE(ids.value().is_token_program(ids.value().amm));
}

void test_config_partial_json() {
  auto json = nlohmann::json::parse(R"({
    "runtime": {"max_invoke_depth": 6},
    "logging": {"level": "DEBUG", "json": true}
  })");
  auto config = ConfigManager::load_from_json(json);
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(static_cast<uint32_t>(6), config->runtime.max_invoke_depth);
  ASSERT_EQ(static_cast<uint64_t>(1000), config->runtime.compute_units_per_instruction);
  ASSERT_EQ(std::string("DEBUG"), config->logging.level);
  ASSERT_TRUE(config->logging.json);
}

void test_config_wrong_type_rejected() {
  auto json = nlohmann::json::parse(R"({"rent": {"lamports_per_byte_year": "lots"}})");
  ASSERT_FALSE(ConfigManager::load_from_json(json).has_value());
  ASSERT_FALSE(ConfigManager::load_from_json(nlohmann::json::array()).has_value());
}

void test_config_validation_errors() {
  RuntimeConfig config;
  config.program_ids.amm = config.program_ids.escrow;
  auto duplicate = ConfigManager::validate(config);
  ASSERT_TRUE(duplicate.error == ConfigError::DUPLICATE_PROGRAM_ID);
  ASSERT_EQ(std::string("program_ids.amm"), duplicate.field_path);
  ASSERT_TRUE(ConfigManager::resolve_program_ids(config).is_err());

  RuntimeConfig bad_id;
  bad_id.program_ids.vault = "not-base58!";
  ASSERT_TRUE(ConfigManager::validate(bad_id).error == ConfigError::INVALID_PROGRAM_ID);

  RuntimeConfig bad_depth;
  bad_depth.runtime.max_invoke_depth = 0;
  ASSERT_TRUE(ConfigManager::validate(bad_depth).error == ConfigError::INVALID_VALUE_RANGE);

  RuntimeConfig bad_level;
  bad_level.logging.level = "VERBOSE";
  ASSERT_CONTAINS(ConfigManager::validate_config(bad_level), "VERBOSE");
}

void test_config_file_round_trip() {
  const std::string path = "pinion_test_config.json";
  RuntimeConfig config;
  config.runtime.max_compute_units = 12345;
  config.rent.exemption_threshold = 3.0;
  ASSERT_TRUE(ConfigManager::save_to_file(config, path));

  auto loaded = ConfigManager::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(static_cast<uint64_t>(12345), loaded->runtime.max_compute_units);
  ASSERT_TRUE(loaded->rent.exemption_threshold == 3.0);
  ASSERT_EQ(config.program_ids.vault, loaded->program_ids.vault);

  ASSERT_FALSE(ConfigManager::load_from_file("does/not/exist.json").has_value());
}

void test_log_levels() {
  ASSERT_TRUE(parse_log_level("TRACE").has_value());
  ASSERT_TRUE(*parse_log_level("CRITICAL") == LogLevel::CRITICAL);
  ASSERT_FALSE(parse_log_level("info").has_value());

  Logger &logger = Logger::instance();
  LogLevel previous = logger.level();
  logger.set_level(LogLevel::WARN);
  ASSERT_FALSE(logger.is_enabled(LogLevel::INFO));
  ASSERT_TRUE(logger.is_enabled(LogLevel::ERROR));
  ASSERT_FALSE(logger.is_debug_enabled());

  RuntimeConfig config;
  config.logging.level = "TRACE";
  ConfigManager::apply_logging(config);
  ASSERT_TRUE(logger.is_enabled(LogLevel::TRACE));
  logger.set_level(previous);
}

void run_common_tests(TestRunner &runner) {
  std::cout << "\n=== Common Tests ===" << std::endl;

  runner.run_test("Result Type Basic", test_result_type);
  runner.run_test("Result Type Move Semantics", test_result_type_move_semantics);
  runner.run_test("Zero Key Detection", test_zero_key_detection);
  runner.run_test("Base58 Known Values", test_base58_known_values);
  runner.run_test("Base58 Rejects Bad Input", test_base58_rejects_bad_input);
  runner.run_test("Byte Reader Bounds", test_byte_reader_bounds);
  runner.run_test("Byte Writer Layout", test_byte_writer_layout);
  runner.run_test("Config Defaults", test_config_defaults);
  runner.run_test("Config Partial JSON", test_config_partial_json);
  runner.run_test("Config Wrong Type Rejected", test_config_wrong_type_rejected);
  runner.run_test("Config Validation Errors", test_config_validation_errors);
  runner.run_test("Config File Round Trip", test_config_file_round_trip);
  runner.run_test("Log Levels", test_log_levels);
}

int main() {
  std::cout << "=== Common Test Suite ===" << std::endl;
  TestRunner runner;
  run_common_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
