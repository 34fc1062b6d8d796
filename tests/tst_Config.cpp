#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/Config.h"

using namespace CamCtl;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanupTestCase();

    void defaults();
    void load_missingFile_keepsDefaults();
    void load_invalidJson_resetsDefaults();
    void load_partialFile_fillsDefaults();
    void load_expandsHome();
    void load_clampsTimings();
    void save_roundTrip();
    void save_usesLoadedPath();
    void save_keepsHomeRelativeDirectories();

private:
    static bool writeFile(const QString& path, const QByteArray& contents);

    QTemporaryDir m_dir;
};

bool TestConfig::writeFile(const QString& path, const QByteArray& contents) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

void TestConfig::init() {
    QVERIFY(m_dir.isValid());
    Config::instance().resetToDefaults();
}

void TestConfig::cleanupTestCase() {
    Config::instance().resetToDefaults();
}

void TestConfig::defaults() {
    const Config& config = Config::instance();

    QCOMPARE(config.storage().photoDirectory, QDir::homePath() + "/Pictures");
    QCOMPARE(config.storage().videoDirectory, QDir::homePath() + "/Videos");
    QCOMPARE(config.camera().source, QString("auto"));
    QCOMPARE(config.camera().width, 1920);
    QCOMPARE(config.camera().height, 1080);
    QCOMPARE(config.camera().format, QString("NV12"));
    QVERIFY(config.overlay().crosshair);
    QVERIFY(config.overlay().clock);
    QCOMPARE(config.timing().stillTimeoutMs, 1000);
    QCOMPARE(config.timing().stopFallbackMs, 5000);
    QCOMPARE(config.timing().playbackPollMs, 500);
}

void TestConfig::load_missingFile_keepsDefaults() {
    Config& config = Config::instance();
    QVERIFY(!config.load(m_dir.filePath("does-not-exist.json")));
    QCOMPARE(config.camera().source, QString("auto"));
}

void TestConfig::load_invalidJson_resetsDefaults() {
    Config& config = Config::instance();

    CameraConfig camera = config.camera();
    camera.source = "test";
    config.setCamera(camera);

    const QString path = m_dir.filePath("broken.json");
    QVERIFY(writeFile(path, "{ \"camera\": { \"source\": "));
    QVERIFY(!config.load(path));
    QCOMPARE(config.camera().source, QString("auto"));
}

void TestConfig::load_partialFile_fillsDefaults() {
    const QString path = m_dir.filePath("partial.json");
    QVERIFY(writeFile(path, R"({ "camera": { "source": "libcamera", "width": 1280 } })"));

    Config& config = Config::instance();
    QVERIFY(config.load(path));
    QCOMPARE(config.camera().source, QString("libcamera"));
    QCOMPARE(config.camera().width, 1280);
    QCOMPARE(config.camera().height, 1080);
    QCOMPARE(config.timing().stopFallbackMs, 5000);
    QCOMPARE(config.configPath(), path);
}

void TestConfig::load_expandsHome() {
    const QString path = m_dir.filePath("home.json");
    QVERIFY(writeFile(path, R"({ "storage": { "photoDirectory": "~/Shots", "videoDirectory": "/data/clips" } })"));

    Config& config = Config::instance();
    QVERIFY(config.load(path));
    QCOMPARE(config.storage().photoDirectory, QDir::homePath() + "/Shots");
    QCOMPARE(config.storage().videoDirectory, QString("/data/clips"));
}

void TestConfig::load_clampsTimings() {
    const QString path = m_dir.filePath("timing.json");
    QVERIFY(writeFile(path, R"({ "timing": { "stillTimeoutMs": 0, "stopFallbackMs": -5, "playbackPollMs": 1, "devicePollMs": 10 } })"));

    Config& config = Config::instance();
    QVERIFY(config.load(path));
    QCOMPARE(config.timing().stillTimeoutMs, 1);
    QCOMPARE(config.timing().stopFallbackMs, 1);
    QCOMPARE(config.timing().playbackPollMs, 50);
    QCOMPARE(config.timing().devicePollMs, 500);
}

void TestConfig::save_roundTrip() {
    Config& config = Config::instance();

    StorageConfig storage;
    storage.photoDirectory = m_dir.filePath("photos");
    storage.videoDirectory = m_dir.filePath("videos");
    config.setStorage(storage);

    CameraConfig camera;
    camera.source = "v4l2:/dev/video2";
    camera.previewWidth = 0;
    config.setCamera(camera);

    OverlayConfig overlay;
    overlay.crosshair = false;
    config.setOverlay(overlay);

    TimingConfig timing;
    timing.stopFallbackMs = 2500;
    config.setTiming(timing);

    const QString path = m_dir.filePath("saved.json");
    QVERIFY(config.save(path));

    config.resetToDefaults();
    QVERIFY(config.load(path));

    QCOMPARE(config.storage().photoDirectory, storage.photoDirectory);
    QCOMPARE(config.storage().videoDirectory, storage.videoDirectory);
    QCOMPARE(config.camera().source, QString("v4l2:/dev/video2"));
    QCOMPARE(config.camera().previewWidth, 0);
    QVERIFY(!config.overlay().crosshair);
    QCOMPARE(config.timing().stopFallbackMs, 2500);
}

void TestConfig::save_usesLoadedPath() {
    const QString path = m_dir.filePath("reuse.json");
    QVERIFY(writeFile(path, "{}"));

    Config& config = Config::instance();
    QVERIFY(config.load(path));

    CameraConfig camera = config.camera();
    camera.source = "test";
    config.setCamera(camera);
    QVERIFY(config.save());

    config.resetToDefaults();
    QVERIFY(config.load(path));
    QCOMPARE(config.camera().source, QString("test"));
}

void TestConfig::save_keepsHomeRelativeDirectories() {
    const QString path = m_dir.filePath("tilde.json");
    QVERIFY(writeFile(path, R"({ "storage": { "photoDirectory": "~/Shots", "videoDirectory": "~/Clips" } })"));

    Config& config = Config::instance();
    QVERIFY(config.load(path));

    // Only the video directory changes in the running app
    StorageConfig storage = config.storage();
    storage.videoDirectory = m_dir.filePath("clips");
    config.setStorage(storage);
    QVERIFY(config.save());

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QJsonObject saved = QJsonDocument::fromJson(file.readAll()).object().value("storage").toObject();
    QCOMPARE(saved.value("photoDirectory").toString(), QString("~/Shots"));
    QCOMPARE(saved.value("videoDirectory").toString(), m_dir.filePath("clips"));

    config.resetToDefaults();
    QVERIFY(config.load(path));
    QCOMPARE(config.storage().photoDirectory, QDir::homePath() + "/Shots");
    QCOMPARE(config.storage().videoDirectory, m_dir.filePath("clips"));
}

QTEST_MAIN(TestConfig)
#include "tst_Config.moc"
