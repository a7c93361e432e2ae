#include "bt_config.h"
#include "fs.h"

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace btcore {

std::optional<CoreConfig> config_from_json(const nlohmann::json& json, BtError* error) {
    if (!json.is_object()) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, "configuration must be a JSON object");
        return std::nullopt;
    }

    CoreConfig config;

    try {
        if (json.contains("block_length")) {
            const auto& value = json.at("block_length");
            if (!value.is_number_integer()) {
                detail::set_error(error, BtErrorCode::InvalidConfiguration, "block_length must be an integer");
                return std::nullopt;
            }
            int64_t block_length = value.get<int64_t>();
            if (block_length <= 0 || block_length > BT_MAX_BLOCK_SIZE) {
                detail::set_error(error, BtErrorCode::InvalidConfiguration,
                                  "block_length must be in [1, " + std::to_string(BT_MAX_BLOCK_SIZE) +
                                  "], got " + std::to_string(block_length));
                return std::nullopt;
            }
            config.block_length = static_cast<uint32_t>(block_length);
        }

        config.peer_id_prefix = json.value("peer_id_prefix", config.peer_id_prefix);
        if (config.peer_id_prefix.size() > BT_ID20_SIZE) {
            detail::set_error(error, BtErrorCode::InvalidConfiguration,
                              "peer_id_prefix is longer than " + std::to_string(BT_ID20_SIZE) + " bytes");
            return std::nullopt;
        }

        if (json.contains("log_level")) {
            std::string level_name = json.at("log_level").get<std::string>();
            auto level = log_level_from_string(level_name);
            if (!level) {
                detail::set_error(error, BtErrorCode::InvalidConfiguration, "unknown log_level: " + level_name);
                return std::nullopt;
            }
            config.log_level = *level;
        }

        config.log_colors = json.value("log_colors", config.log_colors);
        config.log_timestamps = json.value("log_timestamps", config.log_timestamps);

    } catch (const nlohmann::json::exception& e) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, e.what());
        return std::nullopt;
    }

    return config;
}

nlohmann::json config_to_json(const CoreConfig& config) {
    nlohmann::json json;
    json["block_length"] = config.block_length;
    json["peer_id_prefix"] = config.peer_id_prefix;
    json["log_level"] = log_level_to_string(config.log_level);
    json["log_colors"] = config.log_colors;
    json["log_timestamps"] = config.log_timestamps;
    return json;
}

std::optional<CoreConfig> load_config_file(const std::string& path, BtError* error) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration found at " << path << ", using defaults");
        return CoreConfig();
    }

    auto data = read_file_text(path);
    if (!data) {
        detail::set_error(error, BtErrorCode::InvalidConfiguration, "cannot read " + path);
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(*data);
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << path << ": " << e.what());
        detail::set_error(error, BtErrorCode::InvalidConfiguration, e.what());
        return std::nullopt;
    }

    BtError config_error;
    auto config = config_from_json(json, &config_error);
    if (!config) {
        LOG_CONFIG_ERROR("Invalid configuration in " << path << ": " << config_error.message);
        if (error) {
            *error = config_error;
        }
        return std::nullopt;
    }

    LOG_CONFIG_DEBUG("Loaded configuration from " << path);
    return config;
}

bool save_config_file(const std::string& path, const CoreConfig& config) {
    LOG_CONFIG_DEBUG("Saving configuration to " << path);
    return create_file(path, config_to_json(config).dump(4));
}

void apply_logging_config(const CoreConfig& config) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(config.log_level);
    logger.set_colors_enabled(config.log_colors);
    logger.set_timestamps_enabled(config.log_timestamps);
}

} // namespace btcore
