#include "Config.h"
#include <QDebug>

namespace CamCtl {

namespace {

// Accept "~/..." in directory settings
QString expandHome(const QString& path) {
    if (path == "~") {
        return QDir::homePath();
    }
    if (path.startsWith("~/")) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

QString persistedDirectory(const QString& setting, const QString& directory) {
    if (!setting.isEmpty() && expandHome(setting) == directory) {
        return setting;
    }
    return directory;
}

} // namespace

// StorageConfig implementation
QJsonObject StorageConfig::toJson() const {
    return QJsonObject{
        {"photoDirectory", persistedDirectory(photoSetting, photoDirectory)},
        {"videoDirectory", persistedDirectory(videoSetting, videoDirectory)}
    };
}

StorageConfig StorageConfig::fromJson(const QJsonObject& obj) {
    StorageConfig config;
    config.photoSetting = obj.value("photoDirectory").toString(config.photoSetting);
    config.videoSetting = obj.value("videoDirectory").toString(config.videoSetting);
    config.photoDirectory = expandHome(config.photoSetting);
    config.videoDirectory = expandHome(config.videoSetting);
    return config;
}

// CameraConfig implementation
QJsonObject CameraConfig::toJson() const {
    return QJsonObject{
        {"source", source},
        {"width", width},
        {"height", height},
        {"format", format},
        {"previewWidth", previewWidth},
        {"previewHeight", previewHeight}
    };
}

CameraConfig CameraConfig::fromJson(const QJsonObject& obj) {
    CameraConfig config;
    config.source = obj.value("source").toString("auto");
    config.width = obj.value("width").toInt(1920);
    config.height = obj.value("height").toInt(1080);
    config.format = obj.value("format").toString("NV12");
    config.previewWidth = obj.value("previewWidth").toInt(640);
    config.previewHeight = obj.value("previewHeight").toInt(360);
    return config;
}

// OverlayConfig implementation
QJsonObject OverlayConfig::toJson() const {
    return QJsonObject{
        {"crosshair", crosshair},
        {"clock", clock},
        {"elapsed", elapsed},
        {"clockFormat", clockFormat}
    };
}

OverlayConfig OverlayConfig::fromJson(const QJsonObject& obj) {
    OverlayConfig config;
    config.crosshair = obj.value("crosshair").toBool(true);
    config.clock = obj.value("clock").toBool(true);
    config.elapsed = obj.value("elapsed").toBool(true);
    config.clockFormat = obj.value("clockFormat").toString("%Y-%m-%d %H:%M:%S");
    return config;
}

// TimingConfig implementation
QJsonObject TimingConfig::toJson() const {
    return QJsonObject{
        {"stillTimeoutMs", stillTimeoutMs},
        {"stopFallbackMs", stopFallbackMs},
        {"playbackPollMs", playbackPollMs},
        {"devicePollMs", devicePollMs}
    };
}

TimingConfig TimingConfig::fromJson(const QJsonObject& obj) {
    TimingConfig config;
    config.stillTimeoutMs = qMax(1, obj.value("stillTimeoutMs").toInt(1000));
    config.stopFallbackMs = qMax(1, obj.value("stopFallbackMs").toInt(5000));
    config.playbackPollMs = qMax(50, obj.value("playbackPollMs").toInt(500));
    config.devicePollMs = qMax(500, obj.value("devicePollMs").toInt(5000));
    return config;
}

// Config implementation
Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    initializeDefaults();
}

void Config::initializeDefaults() {
    m_storage = StorageConfig();
    m_camera = CameraConfig();
    m_overlay = OverlayConfig();
    m_timing = TimingConfig();
}

bool Config::load(const QString& path) {
    QMutexLocker locker(&m_mutex);

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Could not open config file:" << path;
        initializeDefaults();
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);

    if (error.error != QJsonParseError::NoError) {
        qWarning() << "JSON parse error:" << error.errorString();
        initializeDefaults();
        return false;
    }

    initializeDefaults();
    QJsonObject root = doc.object();

    if (root.contains("storage")) {
        m_storage = StorageConfig::fromJson(root.value("storage").toObject());
    }

    if (root.contains("camera")) {
        m_camera = CameraConfig::fromJson(root.value("camera").toObject());
    }

    if (root.contains("overlay")) {
        m_overlay = OverlayConfig::fromJson(root.value("overlay").toObject());
    }

    if (root.contains("timing")) {
        m_timing = TimingConfig::fromJson(root.value("timing").toObject());
    }

    m_configPath = path;
    qDebug() << "Config loaded from:" << path;
    return true;
}

bool Config::save(const QString& path) {
    QMutexLocker locker(&m_mutex);

    const QString target = path.isEmpty()
        ? (m_configPath.isEmpty() ? QStringLiteral("config.json") : m_configPath)
        : path;

    QJsonObject root;
    root["storage"] = m_storage.toJson();
    root["camera"] = m_camera.toJson();
    root["overlay"] = m_overlay.toJson();
    root["timing"] = m_timing.toJson();

    QJsonDocument doc(root);

    QFile file(target);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Could not open config file for writing:" << target;
        return false;
    }

    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    m_configPath = target;
    qDebug() << "Config saved to:" << target;
    return true;
}

StorageConfig Config::storage() const {
    QMutexLocker locker(&m_mutex);
    return m_storage;
}

CameraConfig Config::camera() const {
    QMutexLocker locker(&m_mutex);
    return m_camera;
}

OverlayConfig Config::overlay() const {
    QMutexLocker locker(&m_mutex);
    return m_overlay;
}

TimingConfig Config::timing() const {
    QMutexLocker locker(&m_mutex);
    return m_timing;
}

void Config::setStorage(const StorageConfig& config) {
    QMutexLocker locker(&m_mutex);
    m_storage = config;
}

void Config::setCamera(const CameraConfig& config) {
    QMutexLocker locker(&m_mutex);
    m_camera = config;
}

void Config::setOverlay(const OverlayConfig& config) {
    QMutexLocker locker(&m_mutex);
    m_overlay = config;
}

void Config::setTiming(const TimingConfig& config) {
    QMutexLocker locker(&m_mutex);
    m_timing = config;
}

void Config::resetToDefaults() {
    QMutexLocker locker(&m_mutex);
    initializeDefaults();
}

QString Config::configPath() const {
    QMutexLocker locker(&m_mutex);
    return m_configPath;
}

} // namespace CamCtl
