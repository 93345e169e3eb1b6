#pragma once

#include <QMainWindow>

#include "core/config/Settings.h"

class QCloseEvent;
class ScramblePage;
class ScramblePresenter;

/**
 * @brief Application main window hosting the scramble page.
 */
class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow();

protected:
  void closeEvent(QCloseEvent* event) override;

private:
  void setupUi();

  Settings settings_;
  ScramblePage* scramblePage_{};
  ScramblePresenter* scramblePresenter_{};
};
