#include "exerun.h"

#include <QCoreApplication>
#include <QThread>

#include <memory>

QProcess* run(const QString& name, const QStringList& args)
{
  qDebug().noquote() << (QStringList() << name << args).join(" ");

  QCoreApplication* app = QCoreApplication::instance();
  QObject* parent = app && app->thread() == QThread::currentThread() ? app : nullptr;

  auto* process = new QProcess(parent);
  process->setProgram(name);
  process->setArguments(args);
  // nothing is ever written to the child, it must see EOF on stdin
  process->setStandardInputFile(QProcess::nullDevice());
  process->start();
  return process;
}

ProcessResult exec(const QString& name, const QStringList& args, int msecs)
{
  std::unique_ptr<QProcess> process{run(name, args)};

  ProcessResult result;

  if (!process->waitForStarted())
  {
    result.errorString = process->errorString();
    qWarning().noquote() << "Could not start" << name << ":" << result.errorString;
    return result;
  }

  result.started = true;

  if (!process->waitForFinished(msecs))
  {
    result.errorString = process->errorString();
    process->kill();
    process->waitForFinished();
  }

  result.exitStatus = process->exitStatus();
  result.exitCode = process->exitCode();
  result.standardError = QString::fromLocal8Bit(process->readAllStandardError());

  if (!result.ok())
  {
    qWarning().noquote() << name << "exited with code" << result.exitCode;
    qDebug().noquote() << result.standardError;
  }

  return result;
}

ProcessResult ProcessToolRunner::execute(const QString& program, const QStringList& args)
{
  return exec(program, args);
}
