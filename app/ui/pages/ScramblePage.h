#pragma once

#include <QWidget>

class QLabel;
class QPlainTextEdit;
class QPushButton;

class OptionsPanel;

/**
 * @brief 打乱页的 UI 容器，仅负责搭建界面并透出必要控件信号。
 */
class ScramblePage : public QWidget {
  Q_OBJECT
public:
  explicit ScramblePage(QWidget* parent = nullptr);

  OptionsPanel* optionsPanel() const { return optionsPanel_; }
  QPlainTextEdit* inputEdit() const { return inputEdit_; }
  QPlainTextEdit* outputView() const { return outputView_; }
  QPushButton* scrambleButton() const { return scrambleBtn_; }
  QPushButton* copyButton() const { return copyBtn_; }
  QPushButton* saveSettingsButton() const { return saveSettingsBtn_; }
  QLabel* statusLabel() const { return statusLabel_; }

signals:
  void inputChanged();
  void scrambleRequested();
  void copyRequested();
  void saveSettingsRequested();

private:
  void buildUi();
  void wireSignals();

  OptionsPanel* optionsPanel_{};
  QPlainTextEdit* inputEdit_{};
  QPlainTextEdit* outputView_{};
  QPushButton* scrambleBtn_{};
  QPushButton* copyBtn_{};
  QPushButton* saveSettingsBtn_{};
  QLabel* statusLabel_{};
};
