#pragma once

#include <QObject>
#include <QString>

#include "core/config/Presets.h"

class OptionsPanel;
class ScrambleController;
class ScramblePage;
struct Settings;

/**
 * @brief 打乱页业务协调器，负责桥接 UI 控件、预设目录与核心打乱器。
 */
class ScramblePresenter : public QObject {
  Q_OBJECT
public:
  ScramblePresenter(ScramblePage* page,
                    Settings& settings,
                    config::ScramblePresetCatalog presets,
                    QObject* parent = nullptr);

  /// 用 Settings 中保存的状态填充界面。
  void restoreFromSettings();

  /// 将界面状态写回 Settings（不落盘）。
  void captureSettings();

private slots:
  void onScrambleRequested();
  void onInputChanged();
  void onOptionsChanged();
  void onPresetSelected(const QString& name);
  void onLiveModeToggled(bool enabled);
  void onCopyRequested();
  void onSaveSettings();

private:
  void runScramble();
  void setStatus(const QString& text, bool isError = false);

  ScramblePage* page_{};
  OptionsPanel* optionsPanel_{};
  Settings* settings_{};
  ScrambleController* controller_{};
  config::ScramblePresetCatalog presets_;
};
