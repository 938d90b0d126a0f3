#pragma once

#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/EngineConfig.h"

namespace rebalex {

class Config {
public:
    static Config& getInstance();

    // Missing file means defaults. Throws std::runtime_error("config_invalid: ...")
    // when the file exists but cannot be parsed.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    // REBALEX_BRIDGE_ROOT, REBALEX_STATE_DIR
    void applyEnvironmentOverrides();

    engine::EngineConfig getEngineConfig() const;
    void setEngineConfig(const engine::EngineConfig& config);
    std::string getLogLevel() const;
    std::string getLoadedPath() const;

private:
    Config() = default;

    mutable std::mutex mutex_;
    engine::EngineConfig engine_config_;
    std::string log_level_ = "info";
    std::string loaded_path_;
};

} // namespace rebalex
