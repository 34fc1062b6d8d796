#include "MainWindow.h"
#include "CameraPage.h"
#include "PhotoBrowser.h"
#include "VideoBrowser.h"
#include "PlaybackView.h"
#include "capture/QtPlaybackBackend.h"
#include "core/CaptureSession.h"
#include "core/PlaybackSession.h"
#include "core/Config.h"
#include "utils/DeviceDetector.h"

#include <QApplication>
#include <QCloseEvent>
#include <QFile>
#include <QDebug>

namespace CamCtl {

MainWindow::MainWindow(CaptureSession* session, QWidget* parent)
    : QMainWindow(parent)
    , m_session(session)
    , m_playback(nullptr)
    , m_deviceDetector(new DeviceDetector(this))
    , m_tabWidget(new QTabWidget(this))
    , m_cameraPage(nullptr)
    , m_photoBrowser(nullptr)
    , m_videoBrowser(nullptr)
{
    setupUi();
    loadStyleSheet();

    m_deviceDetector->startMonitoring(Config::instance().timing().devicePollMs);
}

MainWindow::~MainWindow() {
    m_deviceDetector->stopMonitoring();
}

void MainWindow::setupUi() {
    setWindowTitle("Camera Controller");
    setMinimumSize(800, 600);
    resize(1024, 720);

    const StorageConfig storage = Config::instance().storage();
    const TimingConfig timing = Config::instance().timing();

    // One playback backend for the whole run
    QtPlaybackBackend* backend = new QtPlaybackBackend();
    m_playback = new PlaybackSession(backend, timing.playbackPollMs, this);

    m_cameraPage = new CameraPage(m_session, m_deviceDetector, this, this);
    m_photoBrowser = new PhotoBrowser(storage.photoDirectory, this);
    m_videoBrowser = new VideoBrowser(storage.videoDirectory, m_playback, this);
    backend->setVideoOutput(m_videoBrowser->playbackView()->videoItem());

    m_tabWidget->setObjectName("mainTabs");
    m_tabWidget->addTab(m_cameraPage, "Camera");
    m_tabWidget->addTab(m_photoBrowser, "Photos");
    m_tabWidget->addTab(m_videoBrowser, "Videos");
    setCentralWidget(m_tabWidget);

    connect(m_tabWidget, &QTabWidget::currentChanged, this, &MainWindow::onTabChanged);

    // New captures show up the next time the tab is opened
    connect(m_session, &CaptureSession::photoCaptured, this, [this](const QString&) {
        if (m_tabWidget->currentWidget() == m_photoBrowser) {
            m_photoBrowser->refresh();
        }
    });

    m_tabWidget->setCurrentWidget(m_cameraPage);
    m_previousTab = m_tabWidget->currentIndex();
}

void MainWindow::loadStyleSheet() {
    QFile styleFile(":/styles/styles.qss");
    if (!styleFile.exists()) {
        styleFile.setFileName("resources/styles.qss");
    }

    if (styleFile.open(QFile::ReadOnly | QFile::Text)) {
        QString style = QString::fromUtf8(styleFile.readAll());
        qApp->setStyleSheet(style);
        styleFile.close();
    } else {
        qWarning() << "Could not load stylesheet";
    }
}

void MainWindow::onTabChanged(int index) {
    QWidget* previous = m_tabWidget->widget(m_previousTab);
    QWidget* current = m_tabWidget->widget(index);
    m_previousTab = index;

    if (previous == m_videoBrowser && current != m_videoBrowser) {
        qDebug() << "MainWindow: Leaving Videos tab, stopping playback";
        m_videoBrowser->stopPlayback();
    }

    if (current == m_photoBrowser) {
        m_photoBrowser->refresh();
    } else if (current == m_videoBrowser) {
        m_videoBrowser->refresh();
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    // Release the camera and the playback engine before closing
    m_session->stop();
    m_playback->stop();

    Config::instance().save();

    event->accept();
}

} // namespace CamCtl
