// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef WINDOW_H
#define WINDOW_H

#include "timefield.h"

#include <QMainWindow>
#include <QMap>

#include <optional>
#include <vector>

class QSettings;

class QListWidget;
class QPushButton;

class ClipExtractor;
class Session;
struct ExtractionResult;

class QuickInsertBar;
class VideoRowWidget;

class MainWindow : public QMainWindow
{
  Q_OBJECT
public:
  MainWindow();
  ~MainWindow();

  QSettings& settings() const;
  Session& session() const;
  ClipExtractor& extractor() const;

  QString getLastOpenDir() const;
  void updateLastOpenDir(const QString& path);

  void addVideos(const QStringList& filePaths);
  VideoRowWidget* videoRow(const QString& filePath) const;

  const std::optional<TimeFieldId>& activeField() const;

public Q_SLOTS:
  void about();
  void extractVideo(const QString& filePath);
  void extractAllVideos();
  void playVideo(const QString& filePath);
  void insertQuickValue(int value);
  void setActiveField(const TimeFieldId& field);

protected Q_SLOTS:
  void actAddVideos();
  void actSetExtractorProgram();

protected:
  void closeEvent(QCloseEvent* event) override;

private Q_SLOTS:
  void onEntryAdded(const QString& filePath);
  void refreshUi();

private:
  void showExtractionResult(const ExtractionResult& result);
  void showExtractionSummary(const std::vector<ExtractionResult>& results);

private:
  QSettings* m_settings = nullptr;
  Session* m_session = nullptr;
  ClipExtractor* m_extractor = nullptr;
  struct
  {
    QAction* addVideos = nullptr;
    QAction* extractAll = nullptr;
  } m_actions;
  QuickInsertBar* m_quickInsertBar = nullptr;
  QListWidget* m_videoListWidget = nullptr;
  QPushButton* m_addVideosButton = nullptr;
  QPushButton* m_extractAllButton = nullptr;
  QMap<QString, VideoRowWidget*> m_rows;
  std::optional<TimeFieldId> m_activeField;
  QDialog* m_aboutDialog = nullptr;
};

inline const std::optional<TimeFieldId>& MainWindow::activeField() const
{
  return m_activeField;
}

#endif // WINDOW_H
