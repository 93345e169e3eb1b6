#include "app/ui/pages/ScramblePage.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

#include "app/ui/components/OptionsPanel.h"

ScramblePage::ScramblePage(QWidget* parent) : QWidget(parent) {
  buildUi();
  wireSignals();
}

void ScramblePage::buildUi() {
  auto* layout = new QHBoxLayout(this);
  layout->setSpacing(12);

  // 左侧：原文与结果
  auto* textPanel = new QWidget(this);
  auto* textLayout = new QVBoxLayout(textPanel);
  textLayout->setContentsMargins(0, 0, 0, 0);
  textLayout->setSpacing(8);

  inputEdit_ = new QPlainTextEdit(textPanel);
  inputEdit_->setPlaceholderText(tr("在此输入要打乱的文本"));
  outputView_ = new QPlainTextEdit(textPanel);
  outputView_->setReadOnly(true);

  textLayout->addWidget(new QLabel(tr("原文"), textPanel));
  textLayout->addWidget(inputEdit_, 1);
  textLayout->addWidget(new QLabel(tr("结果"), textPanel));
  textLayout->addWidget(outputView_, 1);

  // 右侧：选项与操作
  auto* sidePanel = new QWidget(this);
  auto* sideLayout = new QVBoxLayout(sidePanel);
  sideLayout->setContentsMargins(0, 0, 0, 0);
  sideLayout->setSpacing(12);

  optionsPanel_ = new OptionsPanel(sidePanel);
  scrambleBtn_ = new QPushButton(tr("打乱"), sidePanel);
  copyBtn_ = new QPushButton(tr("复制结果"), sidePanel);
  saveSettingsBtn_ = new QPushButton(tr("保存设置"), sidePanel);
  statusLabel_ = new QLabel(sidePanel);
  statusLabel_->setWordWrap(true);

  sideLayout->addWidget(optionsPanel_);
  sideLayout->addWidget(scrambleBtn_);
  sideLayout->addWidget(copyBtn_);
  sideLayout->addStretch();
  sideLayout->addWidget(statusLabel_);
  sideLayout->addWidget(saveSettingsBtn_);

  layout->addWidget(textPanel, 1);
  layout->addWidget(sidePanel);
}

void ScramblePage::wireSignals() {
  connect(inputEdit_, &QPlainTextEdit::textChanged, this, &ScramblePage::inputChanged);
  connect(scrambleBtn_, &QPushButton::clicked, this, &ScramblePage::scrambleRequested);
  connect(copyBtn_, &QPushButton::clicked, this, &ScramblePage::copyRequested);
  connect(saveSettingsBtn_, &QPushButton::clicked, this, &ScramblePage::saveSettingsRequested);
}
