#include "window.h"

#include "appsettings.h"
#include "playback.h"
#include "videorowwidget.h"

#include "widgets/quickinsertbar.h"
#include "widgets/timewheel.h"

#include "extractor.h"
#include "session.h"

#include <QDialog>
#include <QFileDialog>
#include <QInputDialog>
#include <QMessageBox>
#include <QProgressDialog>

#include <QAction>
#include <QMenu>
#include <QMenuBar>

#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QListWidgetItem>
#include <QPushButton>

#include <QHBoxLayout>
#include <QVBoxLayout>

#include <QCloseEvent>
#include <QFont>

#include <QFileInfo>
#include <QSettings>

#include <QApplication>
#include <QDebug>

// settings key
constexpr const char* WINDOW_GEOM_KEY = "Window/geometry";
constexpr const char* LAST_OPEN_DIR_KEY = "lastOpenDir";

constexpr const char* VIDEO_FILES_FILTER = "Video Files (*.mp4 *.avi *.mkv)";

constexpr const char* WINDOW_TITLE = "Multi-Video In-Out Extractor";

MainWindow::MainWindow()
{
  setWindowTitle(WINDOW_TITLE);
  setStyleSheet("background-color: #121212; color: white;");

  m_settings = new QSettings(QSettings::IniFormat,
                             QSettings::UserScope,
                             "Analogman Software",
                             "clipcut",
                             this);

  m_session = new Session(this);
  connect(m_session, &Session::entryAdded, this, &MainWindow::onEntryAdded);

  m_extractor = new ClipExtractor(nullptr, this);

  if (AppSettings* appsettings = AppSettings::getInstance(qApp))
  {
    m_extractor->setProgram(appsettings->extractorProgram());
    appsettings->watch(EXTRACTOR_PROGRAM_KEY, this, [this, appsettings]() {
      m_extractor->setProgram(appsettings->extractorProgram());
    });
  }

  if (QMenu* menu = menuBar()->addMenu("File"))
  {
    m_actions.addVideos = menu->addAction("Add Videos...",
                                          QKeySequence("Ctrl+O"),
                                          this,
                                          &MainWindow::actAddVideos);

    menu->addSeparator();

    m_actions.extractAll = menu->addAction("Extract All",
                                           QKeySequence("Ctrl+E"),
                                           this,
                                           &MainWindow::extractAllVideos);

    menu->addSeparator();
    menu->addAction("Quit", QKeySequence("Alt+F4"), this, &MainWindow::close);
  }

  if (QMenu* menu = menuBar()->addMenu("Tools"))
  {
    menu->addAction("FFmpeg program...", this, &MainWindow::actSetExtractorProgram);
  }

  if (QMenu* menu = menuBar()->addMenu("Help"))
  {
    menu->addAction("About", this, &MainWindow::about);
    menu->addAction("About Qt", qApp, &QApplication::aboutQt);
  }

  auto* central = new QWidget(this);

  if (auto* layout = new QVBoxLayout(central))
  {
    layout->setContentsMargins(15, 15, 15, 15);
    layout->setSpacing(15);

    auto* header = new QLabel(WINDOW_TITLE);
    header->setFont(QFont("Arial", 20, QFont::Bold));
    header->setStyleSheet("color: #E0E0E0;");
    header->setAlignment(Qt::AlignCenter);
    layout->addWidget(header);

    m_quickInsertBar = new QuickInsertBar;
    layout->addWidget(m_quickInsertBar, 1);

    m_videoListWidget = new QListWidget;
    m_videoListWidget->setStyleSheet(
        "background-color: #1e1e1e; color: white; border: 1px solid #333;");
    layout->addWidget(m_videoListWidget, 3);

    if (auto* row = new QHBoxLayout)
    {
      m_addVideosButton = new QPushButton("Add Videos");
      m_addVideosButton->setStyleSheet("background-color: #1f1f1f; color: white; padding: 10px; "
                                       "border-radius: 5px; font-size: 16px;");
      row->addWidget(m_addVideosButton);

      m_extractAllButton = new QPushButton("Extract All Videos");
      m_extractAllButton->setStyleSheet("background-color: #4caf50; color: white; "
                                        "font-weight: bold; padding: 10px; border-radius: 5px; "
                                        "font-size: 16px;");
      row->addWidget(m_extractAllButton);

      layout->addLayout(row);
    }
  }

  setCentralWidget(central);

  connect(m_quickInsertBar, &QuickInsertBar::valueClicked, this, &MainWindow::insertQuickValue);
  connect(m_addVideosButton, &QPushButton::clicked, this, &MainWindow::actAddVideos);
  connect(m_extractAllButton, &QPushButton::clicked, this, &MainWindow::extractAllVideos);

  // restore window geometry
  {
    const auto geometry = settings().value(WINDOW_GEOM_KEY, QByteArray()).toByteArray();
    if (!geometry.isEmpty())
      restoreGeometry(geometry);
    else
      setGeometry(100, 100, 900, 600);
  }

  refreshUi();
}

MainWindow::~MainWindow() {}

QSettings& MainWindow::settings() const
{
  return *m_settings;
}

Session& MainWindow::session() const
{
  return *m_session;
}

ClipExtractor& MainWindow::extractor() const
{
  return *m_extractor;
}

QString MainWindow::getLastOpenDir() const
{
  return settings().value(LAST_OPEN_DIR_KEY, QString()).toString();
}

void MainWindow::updateLastOpenDir(const QString& path)
{
  QFileInfo info{path};
  if (info.isFile())
  {
    settings().setValue(LAST_OPEN_DIR_KEY, info.absolutePath());
  }
  else if (info.isDir())
  {
    settings().setValue(LAST_OPEN_DIR_KEY, path);
  }
}

void MainWindow::addVideos(const QStringList& filePaths)
{
  m_session->addFiles(filePaths);
}

VideoRowWidget* MainWindow::videoRow(const QString& filePath) const
{
  return m_rows.value(filePath, nullptr);
}

void MainWindow::about()
{
  if (!m_aboutDialog)
  {
    m_aboutDialog = new QDialog(this);
    m_aboutDialog->setWindowTitle("About | ClipCut");

    auto* layout = new QVBoxLayout(m_aboutDialog);

    layout->addWidget(new QLabel(QString("This is ClipCut v%1.\nClips are written to %2.")
                                     .arg(qApp->applicationVersion(),
                                          QFileInfo(m_extractor->outputDirectory())
                                              .absoluteFilePath())));

    auto* btn = new QPushButton("Ok");
    connect(btn, &QPushButton::clicked, m_aboutDialog, &QDialog::close);
    layout->addWidget(btn, 0, Qt::AlignHCenter);
  }

  m_aboutDialog->show();
}

void MainWindow::extractVideo(const QString& filePath)
{
  const VideoEntry* e = m_session->entry(filePath);

  if (!e)
  {
    return;
  }

  const ExtractionResult result = m_extractor->extract(e->path, e->inTime, e->outTime);
  showExtractionResult(result);
}

void MainWindow::extractAllVideos()
{
  if (m_session->count() == 0)
  {
    return;
  }

  QProgressDialog progress{this};
  progress.setModal(true);
  progress.setRange(0, m_session->count());
  progress.setLabelText("Extracting...");
  progress.setCancelButton(nullptr);
  progress.setMinimumDuration(0);
  progress.show();

  m_actions.extractAll->setEnabled(false);
  m_extractAllButton->setEnabled(false);

  auto c1 = connect(m_extractor, &ClipExtractor::jobStarted, this, [&progress](const QString& path) {
    progress.setLabelText("Extracting " + QFileInfo(path).fileName() + "...");
  });
  auto c2 = connect(m_extractor, &ClipExtractor::entryProcessed, this, [&progress](int done, int total) {
    progress.setMaximum(total);
    progress.setValue(done);
  });

  const std::vector<ExtractionResult> results = m_extractor->extractAll(*m_session);

  disconnect(c1);
  disconnect(c2);

  progress.close();

  refreshUi();

  showExtractionSummary(results);
}

void MainWindow::playVideo(const QString& filePath)
{
  playFile(filePath);
}

void MainWindow::insertQuickValue(int value)
{
  if (!m_activeField)
  {
    return;
  }

  VideoRowWidget* row = videoRow(m_activeField->path);

  if (!row)
  {
    m_activeField.reset();
    return;
  }

  row->wheel(m_activeField->endpoint, m_activeField->unit)->setValue(value);
}

void MainWindow::setActiveField(const TimeFieldId& field)
{
  m_activeField = field;
}

void MainWindow::actAddVideos()
{
  const QStringList paths = QFileDialog::getOpenFileNames(this,
                                                          "Select Videos",
                                                          getLastOpenDir(),
                                                          QString(VIDEO_FILES_FILTER));

  if (paths.isEmpty())
  {
    return;
  }

  updateLastOpenDir(paths.front());

  addVideos(paths);
}

void MainWindow::actSetExtractorProgram()
{
  AppSettings* appsettings = AppSettings::getInstance(qApp);

  if (!appsettings)
  {
    return;
  }

  bool ok = false;
  const QString program = QInputDialog::getText(this,
                                                "FFmpeg program",
                                                "Name or path of the ffmpeg executable:",
                                                QLineEdit::Normal,
                                                appsettings->extractorProgram(),
                                                &ok);

  if (ok)
  {
    appsettings->setExtractorProgram(program);
  }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
  settings().setValue(WINDOW_GEOM_KEY, saveGeometry());
  QMainWindow::closeEvent(event);
}

void MainWindow::onEntryAdded(const QString& filePath)
{
  auto* row = new VideoRowWidget(filePath);

  connect(row, &VideoRowWidget::inTimeChanged, m_session, &Session::setInTime);
  connect(row, &VideoRowWidget::outTimeChanged, m_session, &Session::setOutTime);
  connect(row, &VideoRowWidget::fieldFocused, this, &MainWindow::setActiveField);
  connect(row, &VideoRowWidget::extractRequested, this, &MainWindow::extractVideo);
  connect(row, &VideoRowWidget::playRequested, this, &MainWindow::playVideo);

  auto* item = new QListWidgetItem;
  item->setSizeHint(row->sizeHint());
  m_videoListWidget->addItem(item);
  m_videoListWidget->setItemWidget(item, row);

  m_rows.insert(filePath, row);

  refreshUi();
}

void MainWindow::refreshUi()
{
  const bool has_videos = m_session->count() > 0;
  m_actions.extractAll->setEnabled(has_videos);
  m_extractAllButton->setEnabled(has_videos);
}

void MainWindow::showExtractionResult(const ExtractionResult& result)
{
  const QString name = QFileInfo(result.job.sourcePath).fileName();

  switch (result.error)
  {
  case ExtractionError::None:
    QMessageBox::information(this, "Done", QString("Extraction completed for %1!").arg(name));
    break;
  case ExtractionError::InvalidRange:
    QMessageBox::warning(this, "Invalid Time", result.message);
    break;
  case ExtractionError::ExternalTool:
    QMessageBox::warning(this,
                         "Extraction failed",
                         QString("Extraction failed for %1.\n%2").arg(name, result.message));
    break;
  }
}

void MainWindow::showExtractionSummary(const std::vector<ExtractionResult>& results)
{
  QStringList lines;
  int failures = 0;

  for (const ExtractionResult& r : results)
  {
    const QString name = QFileInfo(r.job.sourcePath).fileName();

    if (r.success())
    {
      lines << QString("%1: done").arg(name);
    }
    else
    {
      ++failures;
      lines << QString("%1: %2").arg(name, r.message.section('\n', 0, 0));
    }
  }

  if (failures == 0)
  {
    QMessageBox::information(this, "Done", "All extractions completed!\n\n" + lines.join('\n'));
  }
  else
  {
    QMessageBox::warning(this,
                         "Done",
                         QString("%1 of %2 extractions failed.\n\n")
                                 .arg(failures)
                                 .arg(int(results.size()))
                             + lines.join('\n'));
  }
}
