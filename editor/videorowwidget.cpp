#include "videorowwidget.h"

#include "widgets/timewheel.h"

#include <QLabel>
#include <QPushButton>

#include <QHBoxLayout>
#include <QVBoxLayout>

#include <QFileInfo>
#include <QFont>

static QLabel* createEndpointLabel(const QString& text)
{
  auto* label = new QLabel(text);
  label->setFont(QFont("Arial", 18, QFont::Bold));
  label->setStyleSheet("color: #E0E0E0; margin-right: 5px;");
  return label;
}

VideoRowWidget::VideoRowWidget(const QString& path, QWidget* parent)
    : QFrame(parent)
    , m_path(path)
{
  setStyleSheet("background-color: #1e1e1e; border: none; margin: 10px;");

  auto* layout = new QVBoxLayout(this);
  layout->setSpacing(10);

  auto* title = new QLabel(QString::fromUtf8("\xF0\x9F\x93\xBD ") + QFileInfo(path).fileName());
  title->setFont(QFont("Arial", 14, QFont::Bold));
  title->setToolTip(path);
  layout->addWidget(title);

  m_inPicker = new TimePicker;
  m_outPicker = new TimePicker;

  if (auto* row = new QHBoxLayout)
  {
    row->setSpacing(5);
    row->addWidget(createEndpointLabel("IN:"));
    row->addWidget(m_inPicker);
    row->addSpacing(20);
    row->addWidget(createEndpointLabel("OUT:"));
    row->addWidget(m_outPicker);
    row->addStretch();
    layout->addLayout(row);
  }

  m_extractButton = new QPushButton("Extract");
  m_extractButton->setStyleSheet("background-color: #00FFFF; color: #000000; font-weight: bold; "
                                 "padding: 10px; border-radius: 5px; font-size: 16px;");
  layout->addWidget(m_extractButton);

  m_playButton = new QPushButton("Play");
  m_playButton->setStyleSheet("background-color: #32CD32; color: #000000; font-weight: bold; "
                              "padding: 10px; border-radius: 5px; font-size: 16px;");
  layout->addWidget(m_playButton);

  connect(m_inPicker, &TimePicker::timeChanged, this, [this](int secs) {
    Q_EMIT inTimeChanged(m_path, secs);
  });
  connect(m_outPicker, &TimePicker::timeChanged, this, [this](int secs) {
    Q_EMIT outTimeChanged(m_path, secs);
  });

  connect(m_inPicker, &TimePicker::fieldFocused, this, [this](TimeUnit unit) {
    Q_EMIT fieldFocused(TimeFieldId{m_path, TimeEndpoint::In, unit});
  });
  connect(m_outPicker, &TimePicker::fieldFocused, this, [this](TimeUnit unit) {
    Q_EMIT fieldFocused(TimeFieldId{m_path, TimeEndpoint::Out, unit});
  });

  connect(m_extractButton, &QPushButton::clicked, this, [this]() {
    Q_EMIT extractRequested(m_path);
  });
  connect(m_playButton, &QPushButton::clicked, this, [this]() { Q_EMIT playRequested(m_path); });
}

VideoRowWidget::~VideoRowWidget() {}

TimePicker* VideoRowWidget::picker(TimeEndpoint endpoint) const
{
  return endpoint == TimeEndpoint::In ? m_inPicker : m_outPicker;
}

TimeWheel* VideoRowWidget::wheel(TimeEndpoint endpoint, TimeUnit unit) const
{
  return picker(endpoint)->wheel(unit);
}

int VideoRowWidget::inTime() const
{
  return m_inPicker->seconds();
}

int VideoRowWidget::outTime() const
{
  return m_outPicker->seconds();
}
