#pragma once

#include <filesystem>
#include <string>

#include "core/scramble/ScrambleOptions.h"

/**
 * @brief 存储桌面程序的所有配置项。
 */
struct Settings {
  ScrambleOptions lastOptions; ///< 上次使用的选项，仅保存显式设置过的字段。
  std::string presetName{"default"}; ///< 上次选中的预设名称。
  bool liveMode{false}; ///< 是否在输入变化时立即重新打乱。
  bool seedEnabled{false}; ///< 种子输入框是否启用；关闭时忽略 lastOptions.seed。

  /**
   * @brief 从默认路径加载配置，若文件不存在则创建。
   * @return 加载或创建的 Settings 对象。
   */
  static Settings loadOrCreate();

  /**
   * @brief 从指定路径加载；文件缺失或损坏时写回默认值。
   * @param path 配置文件路径。
   */
  static Settings loadFrom(const std::filesystem::path& path);

  /**
   * @brief 将当前配置保存到默认路径。
   */
  void save() const;

  /**
   * @brief 保存到指定路径，必要时创建父目录。
   * @return 写入成功返回 true。
   */
  bool saveTo(const std::filesystem::path& path) const;

  /**
   * @brief 获取默认配置文件路径（跨平台）。
   * @return 配置文件路径。
   */
  static std::filesystem::path defaultSettingsPath();
};
