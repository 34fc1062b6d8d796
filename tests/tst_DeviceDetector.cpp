#include <QtTest>
#include <QSignalSpy>

#include "utils/DeviceDetector.h"

using namespace CamCtl;

class TestDeviceDetector : public QObject {
    Q_OBJECT

private slots:
    void sourceId_usesDevicePath();
    void detectDevices_onlyVideoNodesSorted();
    void startMonitoring_reportsInitialList();
    void stopMonitoring_haltsPolling();
};

void TestDeviceDetector::sourceId_usesDevicePath() {
    DeviceInfo info;
    info.index = 2;
    info.devicePath = "/dev/video2";
    info.name = "USB Camera";

    QCOMPARE(info.sourceId(), QString("v4l2:/dev/video2"));
}

void TestDeviceDetector::detectDevices_onlyVideoNodesSorted() {
    DeviceDetector detector;
    const QList<DeviceInfo> devices = detector.detectDevices();

#ifndef __linux__
    QVERIFY(devices.isEmpty());
#endif

    int previous = -1;
    for (const DeviceInfo& device : devices) {
        QVERIFY(device.index > previous);
        QCOMPARE(device.devicePath, QString("/dev/video%1").arg(device.index));
        QVERIFY(device.sourceId().startsWith("v4l2:/dev/video"));
        previous = device.index;
    }

    // Same hardware, same answer
    QVERIFY(detector.detectDevices() == devices);
}

void TestDeviceDetector::startMonitoring_reportsInitialList() {
    DeviceDetector detector;
    QSignalSpy spy(&detector, &DeviceDetector::devicesChanged);

    detector.startMonitoring(60000);

    QVERIFY(detector.isMonitoring());
    QCOMPARE(spy.count(), 1);
    QVERIFY(spy.at(0).at(0).value<QList<DeviceInfo>>() == detector.lastKnownDevices());
}

void TestDeviceDetector::stopMonitoring_haltsPolling() {
    DeviceDetector detector;
    QSignalSpy addedSpy(&detector, &DeviceDetector::deviceAdded);
    QSignalSpy changedSpy(&detector, &DeviceDetector::devicesChanged);

    detector.startMonitoring(20);
    detector.stopMonitoring();
    QVERIFY(!detector.isMonitoring());

    QTest::qWait(100);
    QCOMPARE(changedSpy.count(), 1);
    QCOMPARE(addedSpy.count(), 0);

    // Stopping twice is harmless
    detector.stopMonitoring();
}

QTEST_MAIN(TestDeviceDetector)
#include "tst_DeviceDetector.moc"
