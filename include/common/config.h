#pragma once

#include "common/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pinion {
namespace common {

/**
 * @brief Base58 program identities, as written in the configuration file
 */
struct ProgramIdConfig {
    std::string system = "11111111111111111111111111111111";
    std::string token = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
    std::string token_2022 = "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb";
    std::string associated_token = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";
    std::string escrow = "22222222222222222222222222222222222222222222";
    std::string amm = "33333333333333333333333333333333333333333333";
    std::string vault = "44444444444444444444444444444444444444444444";
};

/**
 * @brief Rent schedule used for rent-exempt minimum balances
 */
struct RentSettings {
    uint64_t lamports_per_byte_year = 3480;
    double exemption_threshold = 2.0;
};

/**
 * @brief Execution engine limits
 */
struct RuntimeSettings {
    uint64_t max_compute_units = 200000;
    uint64_t compute_units_per_instruction = 1000;
    uint32_t max_invoke_depth = 4;
};

struct LoggingSettings {
    std::string level = "INFO";
    bool json = false;
};

/**
 * @brief Complete runtime configuration
 */
struct RuntimeConfig {
    ProgramIdConfig program_ids;
    RentSettings rent;
    RuntimeSettings runtime;
    LoggingSettings logging;
};

/**
 * @brief Decoded program identities injected into every program at
 * construction
 */
struct ProgramIds {
    PublicKey system;
    PublicKey token;
    PublicKey token_2022;
    PublicKey associated_token;
    PublicKey escrow;
    PublicKey amm;
    PublicKey vault;

    /// True for either token program variant
    bool is_token_program(const PublicKey& id) const {
        return id == token || id == token_2022;
    }
};

/**
 * @brief Configuration validation errors
 */
enum class ConfigError {
    NONE,
    INVALID_JSON,
    INVALID_VALUE_RANGE,
    INVALID_PROGRAM_ID,
    DUPLICATE_PROGRAM_ID,
    INVALID_LOG_LEVEL
};

/**
 * @brief Configuration validation result
 */
struct ValidationResult {
    ConfigError error = ConfigError::NONE;
    std::string message;
    std::string field_path;

    bool is_valid() const { return error == ConfigError::NONE; }
};

/**
 * @brief Runtime configuration loader and manager
 */
class ConfigManager {
public:
    /**
     * @brief Load configuration from JSON file
     * @param config_path path to configuration file
     * @return loaded configuration, or nullopt if the file is unreadable or
     *         malformed
     */
    static std::optional<RuntimeConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Save configuration to JSON file
     * @return true if save successful
     */
    static bool save_to_file(const RuntimeConfig& config, const std::string& config_path);

    /**
     * @brief Load configuration from JSON object; missing keys keep defaults
     * @return loaded configuration, or nullopt if a present key has the wrong type
     */
    static std::optional<RuntimeConfig> load_from_json(const nlohmann::json& json);

    static nlohmann::json to_json(const RuntimeConfig& config);

    static RuntimeConfig create_default();

    /**
     * @brief Validate configuration
     * @return validation error message, or empty string if valid
     */
    static std::string validate_config(const RuntimeConfig& config);

    /// Detailed validation with the offending field path
    static ValidationResult validate(const RuntimeConfig& config);

    /**
     * @brief Decode the base58 program ids
     *
     * Fails if any id is not a 32-byte base58 address or if two ids collide.
     */
    static Result<ProgramIds> resolve_program_ids(const RuntimeConfig& config);

    /// Push the logging section into the global Logger
    static void apply_logging(const RuntimeConfig& config);
};

} // namespace common
} // namespace pinion
