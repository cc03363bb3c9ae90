/*
    config.h
    Application configuration backed by a TOML file (config.toml in
    path::kConfigDir).

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = pipecdn::core::config["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        std::string user_id = pipecdn::core::settings.user_id;
        std::string tier = pipecdn::core::settings.default_tier;
        std::uint32_t epochs = pipecdn::core::settings.default_epochs;
    - Write a setting:
        pipecdn::core::settings.user_id = "new_user";

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        pipecdn::core::InitConfig();
    - Save the current configuration to file:
        pipecdn::core::SaveConfig();
*/

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace pipecdn::core {

inline toml::table config;

struct Settings {
    std::string user_id;                  // Active account, empty when logged out
    std::string default_tier = "normal";  // Storage tier used when a request names none
    std::uint32_t default_epochs = 0;     // 0 lets the engine pick its default
};

inline Settings settings;

void InitConfig();

void InitConfig(const std::filesystem::path& config_dir);

void SaveConfig();

void SaveConfig(const std::filesystem::path& config_dir);

} // namespace pipecdn::core
