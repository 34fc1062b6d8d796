#ifndef DEVICEDETECTOR_H
#define DEVICEDETECTOR_H

#include <QObject>
#include <QTimer>
#include <QList>
#include <QString>

namespace CamCtl {

/**
 * @brief A detected video capture device
 */
struct DeviceInfo {
    int index = -1;          // N in /dev/videoN
    QString devicePath;      // e.g. /dev/video0
    QString name;            // Driver-reported card name

    /**
     * @brief Camera source id understood by the pipeline builder
     */
    QString sourceId() const { return QString("v4l2:%1").arg(devicePath); }

    bool operator==(const DeviceInfo& other) const {
        return index == other.index && devicePath == other.devicePath && name == other.name;
    }
};

/**
 * @brief Enumerates capture devices for the camera-source selector
 *
 * Queries V4L2 capabilities without streaming, so polling is safe while
 * a pipeline holds the camera. Only V4L2 nodes map to a camera source, so
 * other platforms report no devices and the selector keeps its fixed
 * entries.
 */
class DeviceDetector : public QObject {
    Q_OBJECT

public:
    explicit DeviceDetector(QObject* parent = nullptr);
    ~DeviceDetector() override;

    /**
     * @brief Scan for capture devices, sorted by index
     */
    QList<DeviceInfo> detectDevices();

    /**
     * @brief Scan once now, then every intervalMs
     */
    void startMonitoring(int intervalMs = 5000);
    void stopMonitoring();
    bool isMonitoring() const { return m_pollTimer->isActive(); }

    QList<DeviceInfo> lastKnownDevices() const { return m_lastKnownDevices; }

signals:
    void deviceAdded(const CamCtl::DeviceInfo& device);
    void deviceRemoved(const CamCtl::DeviceInfo& device);
    void devicesChanged(const QList<CamCtl::DeviceInfo>& devices);

private slots:
    void pollDevices();

private:
    QTimer* m_pollTimer;
    QList<DeviceInfo> m_lastKnownDevices;
};

} // namespace CamCtl

Q_DECLARE_METATYPE(CamCtl::DeviceInfo)
Q_DECLARE_METATYPE(QList<CamCtl::DeviceInfo>)

#endif // DEVICEDETECTOR_H
