/**
 * @file Presets.cpp
 * @brief 实现预设目录的内置数据与 JSON 加载。
 */

#include "core/config/Presets.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/config/OptionsJson.h"

namespace {

using json = nlohmann::json;

/**
 * @brief 通过从当前目录向上搜索来定位配置文件。
 * @param filename 要查找的文件名。
 * @return 如果找到文件，则返回完整路径；否则返回 std::nullopt。
 * @note 在 `setting_config/` 子目录和目录本身中搜索，最多向上搜索 3 层。
 */
std::optional<std::filesystem::path> locateConfigFile(const std::string& filename) {
  std::error_code ec;
  auto cursor = std::filesystem::current_path(ec);
  if (ec) {
    return std::nullopt;
  }
  for (int depth = 0; depth < 3 && !cursor.empty(); ++depth) {
    const auto inSettings = cursor / "setting_config" / filename;
    if (std::filesystem::is_regular_file(inSettings, ec)) {
      return inSettings;
    }
    const auto direct = cursor / filename;
    if (std::filesystem::is_regular_file(direct, ec)) {
      return direct;
    }
    if (cursor == cursor.parent_path()) {
      break;
    }
    cursor = cursor.parent_path();
  }
  return std::nullopt;
}

ScrambleOptions makeOptions(std::optional<int> minLength,
                            std::optional<std::int64_t> seed,
                            std::optional<bool> preserveCase,
                            std::optional<double> probability) {
  ScrambleOptions options;
  options.min_length = minLength;
  options.seed = seed;
  options.preserve_case = preserveCase;
  options.scramble_probability = probability;
  return options;
}

} // namespace

namespace config {

const ScramblePreset* ScramblePresetCatalog::find(const std::string& name) const {
  auto it = std::find_if(presets.begin(), presets.end(),
                         [&name](const ScramblePreset& preset) { return preset.name == name; });
  return it == presets.end() ? nullptr : &*it;
}

void ScramblePresetCatalog::upsert(ScramblePreset preset) {
  auto it = std::find_if(presets.begin(), presets.end(),
                         [&preset](const ScramblePreset& existing) { return existing.name == preset.name; });
  if (it != presets.end()) {
    *it = std::move(preset);
  } else {
    presets.push_back(std::move(preset));
  }
}

ScramblePresetCatalog builtinScramblePresets() {
  ScramblePresetCatalog catalog;
  catalog.presets = {
      {"default", "打乱所有四个字母及以上的词", ScrambleOptions{}},
      {"light", "约三分之一的词被打乱", makeOptions(std::nullopt, std::nullopt, std::nullopt, 0.3)},
      {"heavy", "两个字母及以上的词全部打乱", makeOptions(2, std::nullopt, std::nullopt, 1.0)},
      {"reproducible", "固定种子 42，每次输出相同", makeOptions(std::nullopt, 42, std::nullopt, std::nullopt)},
      {"keep-case-off", "不保留大小写位置，大小写随字母移动", makeOptions(std::nullopt, std::nullopt, false, std::nullopt)},
  };
  return catalog;
}

ScramblePresetCatalog mergeScramblePresets(const json& data, ScramblePresetCatalog base) {
  auto presetsIt = data.find("presets");
  if (!data.is_object() || presetsIt == data.end() || !presetsIt->is_array()) {
    return base;
  }
  for (const auto& item : *presetsIt) {
    if (!item.is_object()) {
      continue;
    }
    auto nameIt = item.find("name");
    if (nameIt == item.end() || !nameIt->is_string() || nameIt->get<std::string>().empty()) {
      spdlog::warn("Skipping preset without a name");
      continue;
    }
    ScramblePreset preset;
    preset.name = nameIt->get<std::string>();
    if (auto descIt = item.find("description"); descIt != item.end() && descIt->is_string()) {
      preset.description = descIt->get<std::string>();
    }
    if (auto optionsIt = item.find("options"); optionsIt != item.end()) {
      preset.options = optionsFromJson(*optionsIt);
    }
    base.upsert(std::move(preset));
  }
  return base;
}

ScramblePresetCatalog loadScramblePresetsFrom(const std::filesystem::path& path) {
  auto catalog = builtinScramblePresets();
  std::ifstream in(path);
  if (!in.is_open()) {
    return catalog;
  }

  try {
    json data;
    in >> data;
    catalog = mergeScramblePresets(data, std::move(catalog));
    spdlog::info("Loaded {} presets from {}", catalog.presets.size(), path.string());
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("Failed to parse preset file {}: {}", path.string(), e.what());
    return builtinScramblePresets();
  }
  return catalog;
}

ScramblePresetCatalog loadScramblePresets() {
  constexpr auto kFilename = "typogly_presets.json";
  auto path = locateConfigFile(kFilename);
  if (!path) {
    return builtinScramblePresets();
  }
  return loadScramblePresetsFrom(*path);
}

} // namespace config
