#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/scramble/ScrambleOptions.h"

/**
 * @file Presets.h
 * @brief 预设选项目录：内置预设 + typogly_presets.json 中的自定义预设。
 */

namespace config {

/**
 * @brief 一个具名的选项预设。
 */
struct ScramblePreset {
  std::string name;        ///< 唯一名称，用作查找键。
  std::string description; ///< 界面显示的说明。
  ScrambleOptions options; ///< 预设选项，未设置的字段取默认值。
};

/**
 * @brief 按加载顺序保存的预设列表。
 */
struct ScramblePresetCatalog {
  std::vector<ScramblePreset> presets;

  /// 按名称查找，找不到返回 nullptr。
  const ScramblePreset* find(const std::string& name) const;

  /// 同名则替换，否则追加到末尾。
  void upsert(ScramblePreset preset);
};

/// 内置预设：default、light、heavy、reproducible、keep-case-off。
ScramblePresetCatalog builtinScramblePresets();

/**
 * @brief 将 JSON 中的预设合并进 base。
 * @param data 形如 {"presets": [{"name", "description", "options"}]} 的对象。
 * @note 缺少名称或格式不符的条目被跳过。
 */
ScramblePresetCatalog mergeScramblePresets(const nlohmann::json& data, ScramblePresetCatalog base);

/**
 * @brief 从指定文件加载预设，文件缺失或无法解析时返回内置预设。
 */
ScramblePresetCatalog loadScramblePresetsFrom(const std::filesystem::path& path);

/**
 * @brief 查找 typogly_presets.json 并加载。
 * @note 从当前目录向上最多 3 层，依次检查 setting_config/ 子目录与目录本身。
 */
ScramblePresetCatalog loadScramblePresets();

} // namespace config
