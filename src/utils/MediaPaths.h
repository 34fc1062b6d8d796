#ifndef MEDIAPATHS_H
#define MEDIAPATHS_H

#include <QString>
#include <QDateTime>

namespace CamCtl {

/**
 * @brief Kind of captured media file
 */
enum class MediaKind {
    Photo,
    Video
};

/**
 * @brief Output file naming and directory helpers
 *
 * Naming: photo_<yyyyMMdd_HHmmss>.jpg, video_<yyyyMMdd_HHmmss>.mp4
 */
class MediaPaths {
public:
    /**
     * @brief File name for a capture started at the given time
     */
    static QString fileName(MediaKind kind, const QDateTime& when);

    /**
     * @brief Absolute output path inside directory
     */
    static QString outputPath(const QString& directory, MediaKind kind,
                              const QDateTime& when = QDateTime::currentDateTime());

    /**
     * @brief Create directory (and parents) if missing
     * @return true if the directory exists afterwards
     */
    static bool ensureDirectoryExists(const QString& path);
};

} // namespace CamCtl

#endif // MEDIAPATHS_H
