#include "appsettings.h"

#include <QDebug>

AppSettings::AppSettings(QObject* parent)
    : QObject(parent)
{}

AppSettings* AppSettings::getInstance(QObject* parent)
{
  return parent->findChild<AppSettings*>();
}

void AppSettings::setValue(const QString& key, const QVariant& value)
{
  const QVariant oldval = this->value(key);
  if (oldval != value)
  {
    qDebug().noquote() << "Setting" << key << "to" << value.toString();
    m_settings.setValue(key, value);
    Q_EMIT valueChanged(key, value, oldval);
  }
}

QString AppSettings::extractorProgram() const
{
  const QString program = value<QString>(EXTRACTOR_PROGRAM_KEY);
  return program.isEmpty() ? QString(EXTRACTOR_PROGRAM_DEFAULT) : program;
}

void AppSettings::setExtractorProgram(const QString& program)
{
  setValue(EXTRACTOR_PROGRAM_KEY, program.trimmed());
}

SettingsWatcher::SettingsWatcher(AppSettings& settings, const QString& key)
    : QObject(nullptr)
    , m_key(key)
{
  connect(&settings, &AppSettings::valueChanged, this, &SettingsWatcher::onSettingValueChanged);
}

void SettingsWatcher::onSettingValueChanged(const QString& key,
                                            const QVariant& newValue,
                                            const QVariant& oldValue)
{
  if (m_key == key)
  {
    Q_EMIT valueChanged(newValue, oldValue);
  }
}
