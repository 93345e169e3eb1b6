#include "app/ui/components/OptionsPanel.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QRegularExpression>
#include <QRegularExpressionValidator>
#include <QSignalBlocker>
#include <QSpinBox>

#include "core/config/Presets.h"

OptionsPanel::OptionsPanel(QWidget* parent) : QWidget(parent) {
  setupUi();
  bindSignals();
}

void OptionsPanel::setupUi() {
  auto* form = new QFormLayout(this);
  form->setLabelAlignment(Qt::AlignRight | Qt::AlignVCenter);
  form->setFormAlignment(Qt::AlignLeft | Qt::AlignTop);
  form->setSpacing(8);

  presetCombo_ = new QComboBox(this);
  form->addRow(tr("预设"), presetCombo_);

  minLengthSpin_ = new QSpinBox(this);
  minLengthSpin_->setRange(0, 64);
  minLengthSpin_->setValue(ScrambleConfig::kDefaultMinLength);
  minLengthSpin_->setToolTip(tr("字母主体短于该长度的词不打乱"));
  form->addRow(tr("最小长度"), minLengthSpin_);

  seedCheck_ = new QCheckBox(tr("固定种子"), this);
  seedEdit_ = new QLineEdit(this);
  seedEdit_->setPlaceholderText(tr("整数种子"));
  seedEdit_->setValidator(new QRegularExpressionValidator(QRegularExpression(QStringLiteral("-?\\d{1,18}")), seedEdit_));
  seedEdit_->setEnabled(false);
  auto* seedRow = new QHBoxLayout();
  seedRow->setContentsMargins(0, 0, 0, 0);
  seedRow->setSpacing(8);
  seedRow->addWidget(seedCheck_);
  seedRow->addWidget(seedEdit_, 1);
  auto* seedWrapper = new QWidget(this);
  seedWrapper->setLayout(seedRow);
  form->addRow(tr("种子"), seedWrapper);

  preserveCaseCheck_ = new QCheckBox(tr("按位置保留大小写"), this);
  preserveCaseCheck_->setChecked(true);
  form->addRow(QString(), preserveCaseCheck_);

  probabilitySpin_ = new QDoubleSpinBox(this);
  probabilitySpin_->setRange(0.0, 1.0);
  probabilitySpin_->setSingleStep(0.05);
  probabilitySpin_->setDecimals(2);
  probabilitySpin_->setValue(1.0);
  form->addRow(tr("打乱概率"), probabilitySpin_);

  liveModeCheck_ = new QCheckBox(tr("输入时实时打乱"), this);
  form->addRow(QString(), liveModeCheck_);
}

void OptionsPanel::bindSignals() {
  auto emitChanged = [this]() {
    if (!suppressSignals_) emit optionsChanged();
  };
  connect(minLengthSpin_, qOverload<int>(&QSpinBox::valueChanged), this, emitChanged);
  connect(probabilitySpin_, qOverload<double>(&QDoubleSpinBox::valueChanged), this, emitChanged);
  connect(preserveCaseCheck_, &QCheckBox::toggled, this, emitChanged);
  connect(seedEdit_, &QLineEdit::textChanged, this, emitChanged);
  connect(seedCheck_, &QCheckBox::toggled, this, [this, emitChanged](bool checked) {
    seedEdit_->setEnabled(checked);
    emitChanged();
  });
  connect(liveModeCheck_, &QCheckBox::toggled, this, &OptionsPanel::liveModeToggled);
  connect(presetCombo_, qOverload<int>(&QComboBox::activated), this, [this](int index) {
    emit presetSelected(presetCombo_->itemData(index).toString());
  });
}

void OptionsPanel::setPresets(const config::ScramblePresetCatalog& catalog) {
  QSignalBlocker blocker(presetCombo_);
  presetCombo_->clear();
  for (const auto& preset : catalog.presets) {
    const QString name = QString::fromStdString(preset.name);
    presetCombo_->addItem(name, name);
    presetCombo_->setItemData(presetCombo_->count() - 1, QString::fromStdString(preset.description), Qt::ToolTipRole);
  }
}

ScrambleOptions OptionsPanel::options() const {
  ScrambleOptions options;
  options.min_length = minLengthSpin_->value();
  options.preserve_case = preserveCaseCheck_->isChecked();
  options.scramble_probability = probabilitySpin_->value();
  if (seedEnabled()) {
    options.seed = seedValue();
  }
  return options;
}

void OptionsPanel::setOptions(const ScrambleOptions& options) {
  const ScrambleConfig config = ScrambleConfig::resolve(options);
  suppressSignals_ = true;
  minLengthSpin_->setValue(config.min_length);
  preserveCaseCheck_->setChecked(config.preserve_case);
  probabilitySpin_->setValue(config.scramble_probability);
  if (config.seed) {
    seedEdit_->setText(QString::number(static_cast<qlonglong>(*config.seed)));
  }
  seedCheck_->setChecked(config.seed.has_value());
  seedEdit_->setEnabled(config.seed.has_value());
  suppressSignals_ = false;
}

bool OptionsPanel::seedEnabled() const {
  return seedCheck_->isChecked();
}

void OptionsPanel::setSeedEnabled(bool enabled) {
  suppressSignals_ = true;
  seedCheck_->setChecked(enabled);
  seedEdit_->setEnabled(enabled);
  suppressSignals_ = false;
}

std::optional<std::int64_t> OptionsPanel::seedValue() const {
  bool ok = false;
  const qlonglong value = seedEdit_->text().toLongLong(&ok);
  if (!ok) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

bool OptionsPanel::liveMode() const {
  return liveModeCheck_->isChecked();
}

void OptionsPanel::setLiveMode(bool enabled) {
  QSignalBlocker blocker(liveModeCheck_);
  liveModeCheck_->setChecked(enabled);
}

QString OptionsPanel::currentPresetName() const {
  return presetCombo_->currentData().toString();
}

void OptionsPanel::selectPreset(const QString& name) {
  QSignalBlocker blocker(presetCombo_);
  const int index = presetCombo_->findData(name);
  if (index >= 0) {
    presetCombo_->setCurrentIndex(index);
  }
}
