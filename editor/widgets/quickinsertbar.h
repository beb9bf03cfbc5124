// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef QUICKINSERTBAR_H
#define QUICKINSERTBAR_H

#include <QScrollArea>

// Grid of buttons 0 to 59 that writes its value into the active time box.
class QuickInsertBar : public QScrollArea
{
  Q_OBJECT
public:
  explicit QuickInsertBar(QWidget* parent = nullptr);
  ~QuickInsertBar();

  static constexpr int ButtonCount = 60;
  static constexpr int ButtonsPerRow = 20;

Q_SIGNALS:
  void valueClicked(int value);
};

#endif // QUICKINSERTBAR_H
