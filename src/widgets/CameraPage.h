#ifndef CAMERAPAGE_H
#define CAMERAPAGE_H

#include <QWidget>
#include <QLabel>
#include <QComboBox>
#include <QPushButton>
#include <QFrame>
#include <QTimer>
#include <QElapsedTimer>
#include <QVector>
#include "core/MediaEngine.h"
#include "utils/DeviceDetector.h"

namespace CamCtl {

class CaptureSession;
class DisplayEmbedder;

/**
 * @brief Camera tab: live preview, photo and record controls
 *
 * Layout:
 *   [ preview container                         ]
 *   [ source selector ] [Preview] [Photo] [Record]
 *   [ status line                    REC 00:00:00 ]
 *
 * The preview container hosts the display sink's native surface when the
 * engine has an embeddable sink. Otherwise the sink opens its own window
 * and the container shows a placeholder.
 */
class CameraPage : public QWidget {
    Q_OBJECT

public:
    CameraPage(CaptureSession* session, DeviceDetector* detector,
               QWidget* appWindow, QWidget* parent = nullptr);
    ~CameraPage() override;

    /**
     * @brief Rebuild the camera-source selector from the detector
     */
    void refreshSourceList();

private slots:
    void onPreviewClicked();
    void onPhotoClicked();
    void onRecordClicked();
    void onSourceSelectorChanged(int index);

    void onModeChanged(CamCtl::CaptureMode mode);
    void onRecordingStarted(const QString& path);
    void onRecordingFinished(const QString& path);
    void onPhotoCaptured(const QString& path);
    void onErrorOccurred(const QString& message);
    void onDisplayWidgetReady(QWidget* widget);
    void onDisplayWidgetReleased(QWidget* widget);
    void onDeviceAdded(const CamCtl::DeviceInfo& device);
    void onDeviceRemoved(const CamCtl::DeviceInfo& device);
    void updateElapsedLabel();

private:
    void setupUi();
    void updateStatusLabel(const QString& text, bool error = false);
    void updateButtons();

    CaptureSession* m_session;
    DeviceDetector* m_deviceDetector;
    DisplayEmbedder* m_embedder{nullptr};

    // UI components
    QFrame* m_previewContainer;
    QLabel* m_placeholderLabel;
    QComboBox* m_sourceSelector;
    QPushButton* m_previewButton;
    QPushButton* m_photoButton;
    QPushButton* m_recordButton;
    QLabel* m_statusLabel;
    QLabel* m_elapsedLabel;

    // Recording clock
    QTimer* m_elapsedTimer;
    QElapsedTimer m_recordClock;

    struct SourceItem {
        QString source;
        QString displayText;
    };
    QVector<SourceItem> m_sourceItems;
};

} // namespace CamCtl

#endif // CAMERAPAGE_H
