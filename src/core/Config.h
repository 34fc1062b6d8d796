#ifndef CONFIG_H
#define CONFIG_H

#include <QString>
#include <QJsonObject>
#include <QJsonDocument>
#include <QFile>
#include <QDir>
#include <QMutex>
#include <QMutexLocker>

namespace CamCtl {

/**
 * @brief Output directories for captured media
 */
struct StorageConfig {
    QString photoDirectory = QDir::homePath() + "/Pictures";
    QString videoDirectory = QDir::homePath() + "/Videos";

    // Values as written in the file, before "~" expansion. Saved back
    // while they still resolve to the directories above.
    QString photoSetting = "~/Pictures";
    QString videoSetting = "~/Videos";

    QJsonObject toJson() const;
    static StorageConfig fromJson(const QJsonObject& obj);
};

/**
 * @brief Camera source and capture format
 *
 * source is one of "auto", "libcamera", "test" or "v4l2:<device>".
 */
struct CameraConfig {
    QString source = "auto";
    int width = 1920;
    int height = 1080;
    QString format = "NV12";
    int previewWidth = 640;    // 0 disables preview scaling
    int previewHeight = 360;

    QJsonObject toJson() const;
    static CameraConfig fromJson(const QJsonObject& obj);
};

/**
 * @brief Text overlays burned into the video branches
 */
struct OverlayConfig {
    bool crosshair = true;
    bool clock = true;
    bool elapsed = true;       // Record mode only
    QString clockFormat = "%Y-%m-%d %H:%M:%S";

    QJsonObject toJson() const;
    static OverlayConfig fromJson(const QJsonObject& obj);
};

/**
 * @brief Timeouts and polling intervals
 */
struct TimingConfig {
    int stillTimeoutMs = 1000;     // Bounded wait for a still buffer
    int stopFallbackMs = 5000;     // Forced stop if EOS never arrives
    int playbackPollMs = 500;
    int devicePollMs = 5000;

    QJsonObject toJson() const;
    static TimingConfig fromJson(const QJsonObject& obj);
};

/**
 * @brief Main configuration manager (Singleton)
 */
class Config {
public:
    static Config& instance();

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Load/Save
    bool load(const QString& path = "config.json");
    bool save(const QString& path = QString());

    // Getters
    StorageConfig storage() const;
    CameraConfig camera() const;
    OverlayConfig overlay() const;
    TimingConfig timing() const;

    // Setters
    void setStorage(const StorageConfig& config);
    void setCamera(const CameraConfig& config);
    void setOverlay(const OverlayConfig& config);
    void setTiming(const TimingConfig& config);

    // Utility
    void resetToDefaults();
    QString configPath() const;

private:
    Config();
    ~Config() = default;

    void initializeDefaults();

    StorageConfig m_storage;
    CameraConfig m_camera;
    OverlayConfig m_overlay;
    TimingConfig m_timing;
    QString m_configPath;

    mutable QMutex m_mutex;
};

} // namespace CamCtl

#endif // CONFIG_H
