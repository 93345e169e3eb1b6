#include "app/ui/MainWindow.h"

#include <utility>

#include <QCloseEvent>
#include <QVBoxLayout>
#include <QWidget>

#include "app/ui/pages/ScramblePage.h"
#include "app/ui/presenters/ScramblePresenter.h"
#include "core/config/Presets.h"
#include "core/log/Log.h"

MainWindow::~MainWindow() = default;

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  initLogging();
  settings_ = Settings::loadOrCreate();

  setupUi();

  auto presets = config::loadScramblePresets();
  spdlog::info("{} presets available", presets.presets.size());
  scramblePresenter_ = new ScramblePresenter(scramblePage_, settings_, std::move(presets), this);
  scramblePresenter_->restoreFromSettings();
}

void MainWindow::setupUi() {
  auto* central = new QWidget(this);
  auto* rootLayout = new QVBoxLayout(central);
  rootLayout->setContentsMargins(12, 12, 12, 12);

  scramblePage_ = new ScramblePage(central);
  rootLayout->addWidget(scramblePage_, 1);

  setCentralWidget(central);
  resize(1024, 640);
  setWindowTitle(QStringLiteral("Typogly"));
}

void MainWindow::closeEvent(QCloseEvent* event) {
  // 关闭时记录界面状态，下次启动恢复
  if (scramblePresenter_) {
    scramblePresenter_->captureSettings();
    settings_.save();
  }
  QMainWindow::closeEvent(event);
}
