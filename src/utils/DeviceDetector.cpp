#include "DeviceDetector.h"
#include <QDebug>
#include <algorithm>

#ifdef __linux__
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/videodev2.h>
#endif

namespace CamCtl {

DeviceDetector::DeviceDetector(QObject* parent)
    : QObject(parent)
    , m_pollTimer(new QTimer(this))
{
    qRegisterMetaType<CamCtl::DeviceInfo>("CamCtl::DeviceInfo");
    qRegisterMetaType<QList<CamCtl::DeviceInfo>>("QList<CamCtl::DeviceInfo>");
    connect(m_pollTimer, &QTimer::timeout, this, &DeviceDetector::pollDevices);
}

DeviceDetector::~DeviceDetector() {
    stopMonitoring();
}

QList<DeviceInfo> DeviceDetector::detectDevices() {
    QList<DeviceInfo> devices;

#ifdef __linux__
    DIR* dir = opendir("/dev");
    if (!dir) {
        qWarning() << "DeviceDetector: Cannot open /dev";
        return devices;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        const QString name = QString::fromUtf8(entry->d_name);
        if (!name.startsWith("video")) {
            continue;
        }

        bool ok;
        const int index = name.mid(5).toInt(&ok);
        if (!ok) {
            continue;
        }

        const QString devicePath = "/dev/" + name;
        int fd = open(devicePath.toUtf8().constData(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            continue;
        }

        struct v4l2_capability cap;
        if (ioctl(fd, VIDIOC_QUERYCAP, &cap) == 0) {
            // Metadata nodes share the driver but cannot capture frames
            const __u32 caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                                          : cap.capabilities;
            if (caps & V4L2_CAP_VIDEO_CAPTURE) {
                DeviceInfo info;
                info.index = index;
                info.devicePath = devicePath;
                info.name = QString::fromUtf8(reinterpret_cast<const char*>(cap.card));
                devices.append(info);
            }
        }
        close(fd);
    }
    closedir(dir);
#endif

    std::sort(devices.begin(), devices.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        return a.index < b.index;
    });

    return devices;
}

void DeviceDetector::startMonitoring(int intervalMs) {
    m_lastKnownDevices = detectDevices();
    emit devicesChanged(m_lastKnownDevices);

    m_pollTimer->start(intervalMs);

    qDebug() << "DeviceDetector: Started monitoring with" << intervalMs << "ms interval";
    qDebug() << "DeviceDetector: Found" << m_lastKnownDevices.size() << "devices";
}

void DeviceDetector::stopMonitoring() {
    m_pollTimer->stop();
}

void DeviceDetector::pollDevices() {
    const QList<DeviceInfo> current = detectDevices();
    if (current == m_lastKnownDevices) {
        return;
    }

    for (const DeviceInfo& device : current) {
        if (!m_lastKnownDevices.contains(device)) {
            qDebug() << "DeviceDetector: Device added -" << device.devicePath << device.name;
            emit deviceAdded(device);
        }
    }
    for (const DeviceInfo& device : m_lastKnownDevices) {
        if (!current.contains(device)) {
            qDebug() << "DeviceDetector: Device removed -" << device.devicePath << device.name;
            emit deviceRemoved(device);
        }
    }

    m_lastKnownDevices = current;
    emit devicesChanged(m_lastKnownDevices);
}

} // namespace CamCtl
