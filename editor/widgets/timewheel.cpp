#include "timewheel.h"

#include <QIntValidator>
#include <QLabel>

#include <QHBoxLayout>

#include <QFocusEvent>

static const char* wheelColor(TimeUnit unit)
{
  switch (unit)
  {
  case TimeUnit::Hours:
    return "#00FFFF";
  case TimeUnit::Minutes:
    return "#39FF14";
  case TimeUnit::Seconds:
  default:
    return "red";
  }
}

static QString wheelStyleSheet(const QString& color)
{
  return QString(R"(
    QComboBox {
      border: 1px solid %1;
      background-color: #222; color: %1;
      font-size: 32px; font-weight: bold;
    }
    QComboBox:focus {
      border: 2px solid #FFA500;
    }
    QComboBox QAbstractItemView {
      background-color: #222; color: %1;
      selection-background-color: #333;
      font-size: 32px; font-weight: bold;
    }
  )")
      .arg(color);
}

TimeWheel::TimeWheel(TimeUnit unit, QWidget* parent)
    : QComboBox(parent)
    , m_unit(unit)
{
  setEditable(true);
  setValidator(new QIntValidator(0, maximum(), this));

  for (int i(0); i <= maximum(); ++i)
  {
    addItem(timeFieldText(unit, i));
  }

  setMaxVisibleItems(60);
  setFixedSize(180, 60);
  setStyleSheet(wheelStyleSheet(wheelColor(unit)));
}

TimeWheel::~TimeWheel() {}

int TimeWheel::maximum() const
{
  return maxTimeFieldValue(unit());
}

int TimeWheel::value() const
{
  return parseTimeField(currentText());
}

void TimeWheel::setValue(int val)
{
  setCurrentText(timeFieldText(unit(), val));
}

void TimeWheel::focusInEvent(QFocusEvent* event)
{
  Q_EMIT focused();
  QComboBox::focusInEvent(event);
}

TimePicker::TimePicker(QWidget* parent)
    : QWidget(parent)
{
  m_hours = new TimeWheel(TimeUnit::Hours, this);
  m_minutes = new TimeWheel(TimeUnit::Minutes, this);
  m_seconds = new TimeWheel(TimeUnit::Seconds, this);

  if (auto* layout = new QHBoxLayout(this))
  {
    layout->setContentsMargins(QMargins());
    layout->setSpacing(5);
    layout->addWidget(m_hours);
    layout->addWidget(new QLabel(":"));
    layout->addWidget(m_minutes);
    layout->addWidget(new QLabel(":"));
    layout->addWidget(m_seconds);
  }

  for (TimeWheel* w : {m_hours, m_minutes, m_seconds})
  {
    connect(w, &QComboBox::currentTextChanged, this, [this]() { Q_EMIT timeChanged(seconds()); });
    connect(w, &TimeWheel::focused, this, [this, w]() { Q_EMIT fieldFocused(w->unit()); });
  }
}

TimePicker::~TimePicker() {}

TimeWheel* TimePicker::wheel(TimeUnit unit) const
{
  switch (unit)
  {
  case TimeUnit::Hours:
    return m_hours;
  case TimeUnit::Minutes:
    return m_minutes;
  case TimeUnit::Seconds:
  default:
    return m_seconds;
  }
}

TimeCode TimePicker::timeCode() const
{
  return TimeCode::fromFields(m_hours->currentText(),
                              m_minutes->currentText(),
                              m_seconds->currentText());
}

int TimePicker::seconds() const
{
  return timeCode().toSeconds();
}

void TimePicker::setSeconds(int secs)
{
  const TimeCode tc = TimeCode::fromSeconds(secs);
  m_hours->setValue(tc.hours());
  m_minutes->setValue(tc.minutes());
  m_seconds->setValue(tc.seconds());
}
