#include "app/ui/presenters/ScramblePresenter.h"

#include <utility>

#include <QClipboard>
#include <QGuiApplication>
#include <QLabel>
#include <QPlainTextEdit>

#include <spdlog/spdlog.h>

#include "app/ui/components/OptionsPanel.h"
#include "app/ui/pages/ScramblePage.h"
#include "app/ui/scramble/ScrambleController.h"
#include "core/config/Settings.h"

ScramblePresenter::ScramblePresenter(ScramblePage* page,
                                     Settings& settings,
                                     config::ScramblePresetCatalog presets,
                                     QObject* parent)
    : QObject(parent),
      page_(page),
      optionsPanel_(page ? page->optionsPanel() : nullptr),
      settings_(&settings),
      controller_(new ScrambleController(this)),
      presets_(std::move(presets)) {
  if (!page_ || !optionsPanel_) {
    return;
  }
  optionsPanel_->setPresets(presets_);

  connect(page_, &ScramblePage::scrambleRequested, this, &ScramblePresenter::onScrambleRequested);
  connect(page_, &ScramblePage::inputChanged, this, &ScramblePresenter::onInputChanged);
  connect(page_, &ScramblePage::copyRequested, this, &ScramblePresenter::onCopyRequested);
  connect(page_, &ScramblePage::saveSettingsRequested, this, &ScramblePresenter::onSaveSettings);
  connect(optionsPanel_, &OptionsPanel::optionsChanged, this, &ScramblePresenter::onOptionsChanged);
  connect(optionsPanel_, &OptionsPanel::presetSelected, this, &ScramblePresenter::onPresetSelected);
  connect(optionsPanel_, &OptionsPanel::liveModeToggled, this, &ScramblePresenter::onLiveModeToggled);
}

void ScramblePresenter::restoreFromSettings() {
  if (!optionsPanel_) {
    return;
  }
  optionsPanel_->selectPreset(QString::fromStdString(settings_->presetName));
  optionsPanel_->setOptions(settings_->lastOptions);
  optionsPanel_->setSeedEnabled(settings_->seedEnabled);
  optionsPanel_->setLiveMode(settings_->liveMode);
  setStatus({});
}

void ScramblePresenter::captureSettings() {
  if (!optionsPanel_) {
    return;
  }
  ScrambleOptions options = optionsPanel_->options();
  // 种子未启用时也记住输入框里的值
  options.seed = optionsPanel_->seedValue();
  settings_->lastOptions = options;
  settings_->seedEnabled = optionsPanel_->seedEnabled();
  settings_->liveMode = optionsPanel_->liveMode();
  settings_->presetName = optionsPanel_->currentPresetName().toStdString();
}

void ScramblePresenter::onScrambleRequested() {
  runScramble();
}

void ScramblePresenter::onInputChanged() {
  if (optionsPanel_->liveMode()) {
    runScramble();
  }
}

void ScramblePresenter::onOptionsChanged() {
  if (optionsPanel_->liveMode()) {
    runScramble();
  }
}

void ScramblePresenter::onPresetSelected(const QString& name) {
  const auto* preset = presets_.find(name.toStdString());
  if (!preset) {
    setStatus(tr("未找到预设：%1").arg(name), true);
    return;
  }
  optionsPanel_->setOptions(preset->options);
  spdlog::debug("Preset applied: {}", preset->name);
  if (optionsPanel_->liveMode()) {
    runScramble();
  } else {
    setStatus(tr("已应用预设：%1").arg(name));
  }
}

void ScramblePresenter::onLiveModeToggled(bool enabled) {
  if (enabled) {
    runScramble();
  }
}

void ScramblePresenter::onCopyRequested() {
  auto* clipboard = QGuiApplication::clipboard();
  if (!clipboard) {
    setStatus(tr("无法访问剪贴板"), true);
    return;
  }
  clipboard->setText(page_->outputView()->toPlainText());
  setStatus(tr("结果已复制"));
}

void ScramblePresenter::onSaveSettings() {
  captureSettings();
  if (settings_->saveTo(Settings::defaultSettingsPath())) {
    setStatus(tr("设置已保存"));
  } else {
    setStatus(tr("设置保存失败，详见日志"), true);
  }
}

void ScramblePresenter::runScramble() {
  const QString input = page_->inputEdit()->toPlainText();
  const ScrambleReport report = controller_->scramble(input, optionsPanel_->options());
  page_->outputView()->setPlainText(QString::fromUtf8(report.text.data(), static_cast<int>(report.text.size())));
  setStatus(tr("共 %1 个词，打乱 %2 个，其中 %3 个发生变化")
                .arg(static_cast<qulonglong>(report.content_tokens))
                .arg(static_cast<qulonglong>(report.scrambled_words))
                .arg(static_cast<qulonglong>(report.changed_words)));
}

void ScramblePresenter::setStatus(const QString& text, bool isError) {
  if (auto* label = page_->statusLabel()) {
    label->setText(text);
    label->setStyleSheet(isError ? QStringLiteral("color: #c62828;")
                                 : QStringLiteral("color: #2e7d32;"));
  }
}
