#pragma once

/**
 * @file bt_config.h
 * @brief JSON configuration for the btcore primitives
 *
 * Example file:
 * @code
 * {
 *     "block_length": 16384,
 *     "peer_id_prefix": "-BC0100-",
 *     "log_level": "info",
 *     "log_colors": true,
 *     "log_timestamps": true
 * }
 * @endcode
 * Every key is optional; missing keys keep their defaults and unknown keys
 * are ignored.
 */

#include "bt_types.h"
#include "bt_error.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace btcore {

struct CoreConfig {
    uint32_t block_length = BT_BLOCK_SIZE;          ///< Nominal block length for new Lengths
    std::string peer_id_prefix = BT_PEER_ID_PREFIX; ///< Prefix passed to generate_peer_id()
    LogLevel log_level = LogLevel::INFO;
    bool log_colors = true;
    bool log_timestamps = true;
};

/**
 * @brief Read settings from a parsed JSON object
 *
 * Fails with InvalidConfiguration if the value is not an object, a key has
 * the wrong type, block_length is 0 or above BT_MAX_BLOCK_SIZE,
 * peer_id_prefix is longer than 20 bytes, or log_level is not a known level.
 */
std::optional<CoreConfig> config_from_json(const nlohmann::json& json, BtError* error = nullptr);

nlohmann::json config_to_json(const CoreConfig& config);

/**
 * @brief Load settings from a JSON file
 *
 * A missing file is not an error and gives the defaults. An unreadable or
 * malformed file fails with InvalidConfiguration.
 */
std::optional<CoreConfig> load_config_file(const std::string& path, BtError* error = nullptr);

/**
 * @brief Write settings as pretty printed JSON
 * @return true if the file was written completely
 */
bool save_config_file(const std::string& path, const CoreConfig& config);

/**
 * @brief Push the logging settings into the global Logger
 */
void apply_logging_config(const CoreConfig& config);

} // namespace btcore
