// UTF-8
#pragma once

#include <QObject>
#include <QString>

#include "core/scramble/Scrambler.h"

/**
 * 打乱控制器：封装 UI 触发到核心 Scrambler 的调用装配，
 * 负责 QString 与 UTF-8 之间的转换，避免将算法细节放在界面类中。
 */
class ScrambleController : public QObject {
  Q_OBJECT
public:
  explicit ScrambleController(QObject* parent = nullptr);

  /**
   * 使用给定选项打乱文本，返回结果与统计。
   * 该方法不更新 UI，仅返回数据，供上层页面自行展示。
   */
  ScrambleReport scramble(const QString& text, const ScrambleOptions& options) const;
};
