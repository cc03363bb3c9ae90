#include <core/constant/path.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace pipecdn::core {

static void LoadSetting() {
    if (!config["setting"].is_table()) {
        if (config.contains("setting")) {
            spdlog::warn("[setting] is not a table, using defaults");
        }
        config.insert_or_assign("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    settings.user_id = setting["user-id"].value_or(std::string{});
    settings.default_tier = setting["default-tier"].value_or(std::string{"normal"});

    auto epochs = setting["default-epochs"].value_or(std::int64_t{0});
    if (epochs < 0) {
        spdlog::warn("Ignoring negative default-epochs {}", epochs);
        epochs = 0;
    }
    settings.default_epochs = static_cast<std::uint32_t>(epochs);
}

void InitConfig() {
    InitConfig(path::kConfigDir);
}

void InitConfig(const std::filesystem::path& config_dir) {
    std::error_code ec;
    if (!std::filesystem::exists(config_dir, ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(config_dir, ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", config_dir.string(), ec.message());
        }
    }
    auto path = config_dir / "config.toml";
    if (!std::filesystem::exists(path, ec)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig() {
    SaveConfig(path::kConfigDir);
}

void SaveConfig(const std::filesystem::path& config_dir) {
    auto path = config_dir / "config.toml";
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"user-id", settings.user_id},
                                {"default-tier", settings.default_tier},
                                {"default-epochs", static_cast<std::int64_t>(settings.default_epochs)},
                            });
    ofs << config;
}

} // namespace pipecdn::core
