#include "core/config/Settings.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

#include "core/config/OptionsJson.h"

/**
 * @file Settings.cpp
 * @brief Load/create application settings backed by a JSON file.
 */

std::filesystem::path Settings::defaultSettingsPath() {
  // Resolve default settings path; Windows uses APPDATA, Linux uses HOME.
#ifdef _WIN32
  const char* appdata = std::getenv("APPDATA");
  std::filesystem::path base = appdata ? appdata : std::filesystem::current_path();
  return base / "Typogly" / "setting_config" / "typogly_settings.json";
#else
  const char* home = std::getenv("HOME");
  std::filesystem::path base = home ? (std::filesystem::path(home) / ".config") : std::filesystem::current_path();
  return base / "Typogly" / "setting_config" / "typogly_settings.json";
#endif
}

Settings Settings::loadOrCreate() {
  return loadFrom(defaultSettingsPath());
}

Settings Settings::loadFrom(const std::filesystem::path& path) {
  Settings settings;
  std::ifstream ifs(path);
  if (ifs.is_open()) {
    try {
      nlohmann::json j;
      ifs >> j;
      settings.lastOptions = optionsFromJson(j.value("options", nlohmann::json::object()));
      settings.presetName = j.value("presetName", "default");
      settings.liveMode = j.value("liveMode", false);
      settings.seedEnabled = j.value("seedEnabled", settings.lastOptions.seed.has_value());
    } catch (const nlohmann::json::exception& e) {
      spdlog::error("Failed to parse settings file {}: {}", path.string(), e.what());
      // Fallback to default settings and write them back to recover a broken file
      settings = Settings{};
      if (!settings.saveTo(path)) {
        spdlog::warn("Continuing with in-memory default settings");
      }
    }
  } else {
    spdlog::info("Settings file not found at {}, creating default.", path.string());
    if (!settings.saveTo(path)) {
      spdlog::warn("Continuing with in-memory default settings");
    }
  }
  return settings;
}

void Settings::save() const {
  if (!saveTo(defaultSettingsPath())) {
    spdlog::warn("Settings were not persisted");
  }
}

bool Settings::saveTo(const std::filesystem::path& path) const {
  nlohmann::json j;
  j["options"] = optionsToJson(lastOptions);
  j["presetName"] = presetName;
  j["liveMode"] = liveMode;
  j["seedEnabled"] = seedEnabled;

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error("Failed to create settings directory {}: {}", path.parent_path().string(), ec.message());
    }
  }
  std::ofstream ofs(path);
  if (!ofs.is_open()) {
    spdlog::error("Failed to save settings file {}", path.string());
    return false;
  }
  ofs << j.dump(2); // Pretty print with 2 spaces
  return static_cast<bool>(ofs);
}
