#include "quickinsertbar.h"

#include <QGridLayout>
#include <QPushButton>

QuickInsertBar::QuickInsertBar(QWidget* parent)
    : QScrollArea(parent)
{
  setStyleSheet("border: none;");
  setWidgetResizable(true);
  setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);
  setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);

  auto* container = new QWidget;
  auto* grid = new QGridLayout(container);
  grid->setSpacing(6);
  grid->setContentsMargins(QMargins());

  for (int i(0); i < ButtonCount; ++i)
  {
    auto* btn = new QPushButton(QString::number(i));
    btn->setFixedSize(80, 80);

    const char* color = i <= 2 ? "#00FFFF" : "#FF00FF";

    btn->setStyleSheet(QString(R"(
      QPushButton {
        color: %1;
        background-color: #2a2a2a;
        border-radius: 0;
        font-size: 24px;
        font-weight: bold;
      }
      QPushButton:hover {
        background-color: #444444;
      }
    )")
                           .arg(color));

    btn->setFocusPolicy(Qt::NoFocus);

    connect(btn, &QPushButton::clicked, this, [this, i]() { Q_EMIT valueClicked(i); });

    grid->addWidget(btn, i / ButtonsPerRow, i % ButtonsPerRow);
  }

  setWidget(container);
}

QuickInsertBar::~QuickInsertBar() {}
