// UTF-8
#include "app/ui/scramble/ScrambleController.h"

#include <QByteArray>

ScrambleController::ScrambleController(QObject* parent) : QObject(parent) {}

ScrambleReport ScrambleController::scramble(const QString& text, const ScrambleOptions& options) const {
  // 每次调用都新建打乱器，随机状态不跨调用保留
  const QByteArray utf8 = text.toUtf8();
  Scrambler scrambler(options);
  return scrambler.run(std::string_view(utf8.constData(), static_cast<std::size_t>(utf8.size())));
}
