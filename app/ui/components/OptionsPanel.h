#pragma once

#include <cstdint>
#include <optional>

#include <QWidget>

#include "core/scramble/ScrambleOptions.h"

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLineEdit;
class QSpinBox;

namespace config {
struct ScramblePresetCatalog;
}

/**
 * @brief 打乱选项面板：预设、最小长度、种子、保留大小写、概率与实时模式。
 */
class OptionsPanel : public QWidget {
  Q_OBJECT
public:
  explicit OptionsPanel(QWidget* parent = nullptr);

  QComboBox* presetCombo() const { return presetCombo_; }
  QCheckBox* liveModeCheck() const { return liveModeCheck_; }

  /// 用目录中的预设重建下拉框，itemData 为预设名称。
  void setPresets(const config::ScramblePresetCatalog& catalog);

  /**
   * @brief 读取当前控件状态。
   * @note 种子未启用或输入无法解析时不设置 seed 字段。
   */
  ScrambleOptions options() const;

  /// 写入控件；有种子时同时勾选种子框。不触发 optionsChanged。
  void setOptions(const ScrambleOptions& options);

  bool seedEnabled() const;
  void setSeedEnabled(bool enabled);
  /// 种子输入框中的值，与是否启用无关。
  std::optional<std::int64_t> seedValue() const;
  bool liveMode() const;
  void setLiveMode(bool enabled);

  QString currentPresetName() const;
  void selectPreset(const QString& name);

signals:
  void optionsChanged();
  void presetSelected(const QString& name);
  void liveModeToggled(bool enabled);

private:
  void setupUi();
  void bindSignals();

  QComboBox* presetCombo_{};
  QSpinBox* minLengthSpin_{};
  QCheckBox* seedCheck_{};
  QLineEdit* seedEdit_{};
  QCheckBox* preserveCaseCheck_{};
  QDoubleSpinBox* probabilitySpin_{};
  QCheckBox* liveModeCheck_{};
  bool suppressSignals_ = false;
};
