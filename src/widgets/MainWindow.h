#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QTabWidget>

namespace CamCtl {

class CaptureSession;
class PlaybackSession;
class DeviceDetector;
class CameraPage;
class PhotoBrowser;
class VideoBrowser;

/**
 * @brief Main application window
 *
 * Contains a tab widget with:
 * - CameraPage (preview, photo, record)
 * - PhotoBrowser (saved photos)
 * - VideoBrowser (saved videos)
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    /**
     * @param session Capture session, not owned
     */
    explicit MainWindow(CaptureSession* session, QWidget* parent = nullptr);
    ~MainWindow() override;

    CameraPage* cameraPage() const { return m_cameraPage; }
    PhotoBrowser* photoBrowser() const { return m_photoBrowser; }
    VideoBrowser* videoBrowser() const { return m_videoBrowser; }

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onTabChanged(int index);

private:
    void setupUi();
    void loadStyleSheet();

    CaptureSession* m_session;
    PlaybackSession* m_playback;
    DeviceDetector* m_deviceDetector;

    QTabWidget* m_tabWidget;
    CameraPage* m_cameraPage;
    PhotoBrowser* m_photoBrowser;
    VideoBrowser* m_videoBrowser;
    int m_previousTab{0};
};

} // namespace CamCtl

#endif // MAINWINDOW_H
